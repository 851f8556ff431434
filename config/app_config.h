#pragma once

// ── Shelf geometry
#define SHELFWATCH_NUM_SLOTS            4

// ── Transport (UDS)
#define SHELFWATCH_UDS_PATH             "/tmp/shelfwatch_uds"      // daemon listens here
#define SHELFWATCH_PEER_UDS_PATH        "/tmp/shelfwatch_app_uds"  // cart/status events go here

// ── Topics
#define SHELFWATCH_TOPIC_DATA           "shelf/data"
#define SHELFWATCH_TOPIC_CONTROL        "shelf/control"
#define SHELFWATCH_TOPIC_CONTROL_REPLY  "shelf/control/reply"
#define SHELFWATCH_TOPIC_STATUS         "shelf/status"
#define SHELFWATCH_TOPIC_CART_ADD       "cart/add"
#define SHELFWATCH_TOPIC_CART_REMOVE    "cart/remove"

// ── Detector
#define SHELFWATCH_WINDOW_LEN           2       // rolling median length (K)
#define SHELFWATCH_EXTRANEOUS_LIMIT_G   5000.0  // per-cycle delta treated as a glitch
#define SHELFWATCH_DEBOUNCE_CYCLES      0       // quiet cycles before a latch resets
#define SHELFWATCH_MAX_UNITS_PER_CYCLE  1000    // larger per-cycle counts are treated as a glitch
#define SHELFWATCH_DEFAULT_FACTOR       0.44    // raw → gram until calibrated
#define SHELFWATCH_KNOWN_TARE_WEIGHT_G  226.0   // reference mass used by tare()

// 주기/틱(ms)
#define SHELFWATCH_CADENCE_MS           200
#define SHELFWATCH_STALE_CADENCES       10      // 10 x 200ms = 2s without a report → stale
#define SHELFWATCH_RX_TIMEOUT_MS        100

// ── Worker queue
#define SHELFWATCH_QUEUE_CAPACITY       256
