#include "lobsync/postprocess/FilePersistSink.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

namespace lobsync {
    FilePersistSink::FilePersistSink(std::string path)
        : path_(std::move(path)) {
        std::error_code ec;
        const std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        if (ec) {
            std::cerr << "[FilePersistSink] cannot create " << p.parent_path() << ": " << ec.message() << "\n";
            return;
        }

        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            std::cerr << "[FilePersistSink] cannot open " << path_ << ", persistence disabled\n";
        }
    }

    std::int64_t FilePersistSink::now_ns_() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    }

    void FilePersistSink::publish(std::string_view key, std::string payload) {
        if (!out_.is_open()) return;

        nlohmann::json j;
        j["key"] = std::string(key);
        j["persist_seq"] = ++persist_seq_;
        j["ts_persist_ns"] = now_ns_();

        // Keep the payload structured when it is JSON, raw string otherwise.
        auto parsed = nlohmann::json::parse(payload, nullptr, false);
        if (parsed.is_discarded()) {
            j["payload"] = std::move(payload);
        } else {
            j["payload"] = std::move(parsed);
        }

        out_ << j.dump() << '\n';
        out_.flush();
        if (!out_) {
            std::cerr << "[FilePersistSink] write to " << path_ << " failed\n";
            out_.clear();
        }
    }
} // namespace lobsync
