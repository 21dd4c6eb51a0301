#include "logger_spdlog.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>


namespace logging {

SpdlogBackend::~SpdlogBackend() = default;

void SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t:%t] %v");
    initialized_ = true;
}

void SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l){ l->flush(); });
    spdlog::drop_all();
    initialized_ = false;
}

void SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    registerLoggerLocked_(tag);
}

void SpdlogBackend::registerLoggerLocked_(const std::string& tag) {
    if (spdlog::get(tag)) return;

    std::vector<spdlog::sink_ptr> sinks;
    auto it = tag_sinks_.find(tag);
    if (it != tag_sinks_.end()) sinks = it->second;

    // attach global sink
    auto g_it = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (g_it != tag_sinks_.end()) {
        sinks.insert(sinks.end(), g_it->second.begin(), g_it->second.end());
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    auto lv = tag_levels_.find(tag);
    logger->set_level(toSpd_(lv != tag_levels_.end() ? lv->second : global_level_));
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> SpdlogBackend::loggerFor_(const std::string& tag) {
    auto logger = spdlog::get(tag);
    if (!logger) {
        registerLoggerLocked_(tag);
        logger = spdlog::get(tag);
    }
    return logger;
}

void SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        // 태그별 레벨이 없는 logger 에 전역 레벨 반영
        spdlog::apply_all([this, level](const std::shared_ptr<spdlog::logger>& l) {
            if (tag_levels_.count(l->name()) == 0) l->set_level(toSpd_(level));
        });
        return;
    }
    tag_levels_[tag] = level;
    auto logger = spdlog::get(tag);
    if (logger) {
        logger->set_level(toSpd_(level));
    }
}

bool SpdlogBackend::shouldLog(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_ || disabled_tags_.count(tag)) return false;
    auto lv = tag_levels_.find(tag);
    Level threshold = (lv != tag_levels_.end()) ? lv->second : global_level_;
    return threshold != Level::Off && level >= threshold;
}

void SpdlogBackend::setConsoleSink(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

void SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
}

void SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
}

void SpdlogBackend::setSyslogSink(const std::string& tag, const std::string& ident) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_USER, true));
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!initialized_ || disabled_tags_.count(tag)) return;
        logger = loggerFor_(tag);
    }

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l){ l->flush(); });
    }
}


} // namespace logging
