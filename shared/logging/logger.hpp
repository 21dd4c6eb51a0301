#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

class Logger {
public:
    static Logger& instance();

    // filename 의 YAML 문서에서 "log" 섹션을 읽는다.
    void init(logging::Type logger, const std::string& filename);
    // 이미 로드된 YAML 문서 (root) 로 초기화
    void init(logging::Type logger, const YAML::Node& root);
    void apply();
    void shutdown();

    bool enabled(const std::string& tag, Level level) {
        auto backend = backend_();
        return backend && backend->shouldLog(tag, level);
    }

    void log(const std::string& tag, Level level, const std::string& msg) {
        auto backend = backend_();
        if (backend) backend->log(tag, level, msg);
    }

    void setLevel(const std::string& tag, Level level) { auto b = backend_(); if (b) b->setLevel(tag, level); }
    void enableTag(const std::string& tag) { auto b = backend_(); if (b) b->enableTag(tag); }
    void disableTag(const std::string& tag) { auto b = backend_(); if (b) b->disableTag(tag); }

    static logging::Level toLevel(const std::string& s);

private:
    Logger() = default;
    ~Logger();

    // 복사/이동 금지
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<LoggerBackend> backend_() {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }
    void configureSink(const std::string& tag, const YAML::Node& sink);

    std::mutex mutex_;
    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
};

} // namespace logging
