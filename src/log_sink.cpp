#include "log_sink.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>


namespace shelfwatch {

bool LogSink::open(const std::string& path) {
	std::lock_guard<std::mutex> lk(mu_);
	f_.open(path, std::ios::app);
	return (bool)f_;
}


void LogSink::write(const std::string& tag, const std::string& line) {
	using namespace std::chrono;
	auto t = system_clock::now();
	auto tt = system_clock::to_time_t(t);
	auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
	std::tm tm{}; localtime_r(&tt, &tm);

	std::ostringstream s;
	s << "[" << std::put_time(&tm, "%F %T") << "."
		<< std::setw(3) << std::setfill('0') << ms.count()
		<< "][" << tag << "] " << line << "\n";

	std::lock_guard<std::mutex> lk(mu_);
	std::ostream& out = f_.is_open() ? static_cast<std::ostream&>(f_) : std::cerr;
	out << s.str();
	out.flush();
}

} // namespace shelfwatch
