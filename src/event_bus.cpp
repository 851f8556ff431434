#include "event_bus.hpp"
#include <cstdint>
#include <cstring>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;


namespace shelfwatch {

static constexpr uint32_t kMaxFrame = 64 * 1024; ///< 선반 메시지는 수백 바이트
static constexpr int kFrameTimeoutMs = 1000;     ///< 무한 대기 receive()에서 프레임 읽기 한도

static int mk_server(const std::string& path, mode_t mode) {
	int fd = socket(AF_UNIX, SOCK_STREAM, 0);
	if (fd < 0) return -1;
	sockaddr_un addr{}; addr.sun_family = AF_UNIX;
	std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
	unlink(path.c_str()); // 기존 파일 제거
	if (bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) { ::close(fd); return -1; }
	chmod(path.c_str(), mode); // 퍼미션 적용(예: 0660)
	if (::listen(fd, 8) < 0) { ::close(fd); return -1; }
	return fd;
}


// 끝까지 읽기 (EOF/에러 시 false)
static bool read_all(int fd, char* p, size_t len) {
	size_t n = 0;
	while (n < len) {
		ssize_t k = read(fd, p + n, len - n);
		if (k <= 0) return false;
		n += (size_t)k;
	}
	return true;
}


bool EventBus::listen(const std::string& path, mode_t mode) {
	if (srv_fd_ >= 0) return true;
	srv_fd_ = mk_server(path, mode);
	if (srv_fd_ >= 0) srv_path_ = path;
	return srv_fd_ >= 0;
}


void EventBus::close() {
	if (srv_fd_ < 0) return;
	::close(srv_fd_); srv_fd_ = -1;
	unlink(srv_path_.c_str());
}


std::unique_ptr<json> EventBus::receive(int timeout_ms) {
	if (srv_fd_ < 0) return nullptr;
	if (timeout_ms >= 0) {
		fd_set rf; FD_ZERO(&rf); FD_SET(srv_fd_, &rf);
		timeval tv{ timeout_ms / 1000, (timeout_ms % 1000) * 1000 };
		int r = select(srv_fd_ + 1, &rf, nullptr, nullptr, &tv);
		if (r <= 0) return nullptr;
	}
	int cli = accept(srv_fd_, nullptr, nullptr);
	if (cli < 0) return nullptr;

	// 접속만 하고 보내지 않는 피어가 수신 루프를 막지 않도록
	const int rd_ms = timeout_ms > 0 ? timeout_ms : kFrameTimeoutMs;
	timeval rto{ rd_ms / 1000, (rd_ms % 1000) * 1000 };
	if (setsockopt(cli, SOL_SOCKET, SO_RCVTIMEO, &rto, sizeof(rto)) < 0) { ::close(cli); return nullptr; }

	uint32_t len = 0;
	if (!read_all(cli, (char*)&len, sizeof(len)) || len > kMaxFrame) { ::close(cli); return nullptr; }

	std::string buf; buf.resize(len);
	if (len > 0 && !read_all(cli, &buf[0], len)) { ::close(cli); return nullptr; }
	::close(cli);

	auto j = std::make_unique<json>(json::parse(buf, nullptr, false));
	if (j->is_discarded()) return nullptr;
	return j;
}


bool EventBus::send(const std::string& path, const json& j) {
	int fd = socket(AF_UNIX, SOCK_STREAM, 0);
	if (fd < 0) return false;
	sockaddr_un addr{}; addr.sun_family = AF_UNIX;
	std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
	if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) { ::close(fd); return false; }

	std::string s = j.dump();
	uint32_t len = (uint32_t)s.size();
	if (write(fd, &len, sizeof(len)) != (ssize_t)sizeof(len)) { ::close(fd); return false; }
	if (write(fd, s.data(), s.size()) != (ssize_t)s.size()) { ::close(fd); return false; }
	::close(fd);
	return true;
}


void EventBus::subscribe(const std::string& topic, Handler h) {
	std::lock_guard<std::mutex> lk(mu_);
	handlers_[topic] = std::move(h);
}


bool EventBus::dispatch(const json& envelope) {
	if (!envelope.is_object()) return false;
	auto t = envelope.find("topic");
	auto p = envelope.find("payload");
	if (t == envelope.end() || !t->is_string() || p == envelope.end()) return false;

	Handler h;
	{
		std::lock_guard<std::mutex> lk(mu_);
		auto it = handlers_.find(t->get<std::string>());
		if (it == handlers_.end()) return false;
		h = it->second;
	}
	h(t->get<std::string>(), *p);
	return true;
}


bool EventBus::publish(const std::string& topic, const json& payload) {
	if (peer_path_.empty()) return false;
	return send(peer_path_, json{ {"topic", topic}, {"payload", payload} });
}

} // namespace shelfwatch
