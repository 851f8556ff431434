#pragma once
#include <string>
#include <fstream>
#include <mutex>


namespace shelfwatch {

/**
* LogSink
* - 타임스탬프 + 태그 한 줄 로그: `[YYYY-MM-DD HH:MM:SS.mmm][TAG] message`
* - open()으로 파일을 지정하면 append, 지정하지 않으면 stderr로 출력.
* - 여러 스레드(수신/워커/워치독)에서 동시에 호출 가능 (mutex 보호).
*/
class LogSink {
public:
	bool open(const std::string& path); ///< 파일 오픈(append)
	void write(const std::string& tag, const std::string& line); ///< 타임스탬프 + 라인 기록
private:
	std::ofstream f_;
	std::mutex mu_;
};

} // namespace shelfwatch
