#include "logger.hpp"
#include "logger_spdlog.hpp"
#include <iostream>
#include <stdexcept>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // C++11 이후 thread-safe 보장
    return instance;
}

// NOTE: spdlog registry 가 먼저 소멸될 수 있으므로 소멸자에서는 shutdown 하지 않는다.
//       종료 시점에 logging::shutdown() 을 명시적으로 호출할 것.
Logger::~Logger() = default;

void Logger::init(logging::Type logger_type, const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const std::exception& e) {
        std::cerr << "YAML load error: " << e.what() << std::endl;
        throw;
    }
    init(logger_type, root);
}

void Logger::init(logging::Type logger_type, const YAML::Node& root) {
    std::shared_ptr<LoggerBackend> backend;
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        backend = std::make_shared<SpdlogBackend>();
        break;
    default:
        throw std::runtime_error("unknown logger type");
    }
    backend->init();

    std::shared_ptr<LoggerBackend> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = root;
        previous.swap(logger_);
        logger_ = std::move(backend);
    }
    if (previous) previous->shutdown();
}

void Logger::shutdown() {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend.swap(logger_);
    }
    if (backend) backend->shutdown();
}

logging::Level Logger::toLevel(const std::string& s) {
    if (s == "trace") return logging::Level::Trace;
    if (s == "debug") return logging::Level::Debug;
    if (s == "info")  return logging::Level::Info;
    if (s == "warn")  return logging::Level::Warn;
    if (s == "error") return logging::Level::Error;
    if (s == "fatal") return logging::Level::Fatal;
    return logging::Level::Off;
}

void Logger::apply() {
    YAML::Node log;
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_ || !config_["log"]) return;
        log = config_["log"];
        backend = logger_;
    }
    if (!backend) return;

    auto g_tag = std::string(GLOBAL_TAG);
    if (log[g_tag]) {
        auto node = log[g_tag];

        // Global level 설정
        if (node["level"]) {
            backend->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
        }

        // Global sink 설정
        if (node["sinks"]) {
            for (auto sink : node["sinks"]) {
                configureSink(g_tag, sink);
            }
        }
    }

    for (auto it : log) {
        std::string tag = it.first.as<std::string>();
        if (tag == GLOBAL_TAG) continue;
        auto node = it.second;

        if (node["sinks"]) {
            for (auto sink : node["sinks"]) {
                configureSink(tag, sink);
            }
        }
        backend->registerLogger(tag);

        // 레벨 적용
        if (node["level"]) {
            backend->setLevel(tag, toLevel(node["level"].as<std::string>()));
        }
        if (node["enabled"] && !node["enabled"].as<bool>()) {
            backend->disableTag(tag);
        }
    }
}

void Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    auto backend = backend_();
    if (!backend) return;

    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        backend->setConsoleSink(tag);
    } else if (type == "file") {
        backend->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        backend->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        backend->setSyslogSink(tag,
            sink["ident"] ? sink["ident"].as<std::string>() : tag);
    } else {
        std::cerr << "Unknown sink type: " << type << std::endl;
    }
}

} // namespace logging
