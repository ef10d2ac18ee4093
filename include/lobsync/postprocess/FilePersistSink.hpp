#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

#include "lobsync/abstract/PublishSink.hpp"

namespace lobsync {
    /**
     * @brief Appends one JSON line per publish: {"key", "persist_seq", "ts_persist_ns", "payload"}.
     *
     * Best-effort: a sink whose file could not be opened stays disabled (is_open() == false)
     * and write failures never stop the feed.
     */
    class FilePersistSink final : public IPublishSink {
    public:
        explicit FilePersistSink(std::string path);

        [[nodiscard]] bool is_open() const noexcept { return out_.is_open(); }
        [[nodiscard]] const std::string &path() const noexcept { return path_; }

        void publish(std::string_view key, std::string payload) override;

    private:
        static std::int64_t now_ns_() noexcept;

    private:
        std::ofstream out_;
        std::string path_;
        std::uint64_t persist_seq_{0};
    };

    /**
     * @brief Forwards every publish to each child sink in order.
     */
    class FanoutPublishSink final : public IPublishSink {
    public:
        void add(std::shared_ptr<IPublishSink> sink) {
            if (sink) sinks_.push_back(std::move(sink));
        }

        [[nodiscard]] std::size_t size() const noexcept { return sinks_.size(); }

        void publish(std::string_view key, std::string payload) override {
            for (std::size_t i = 0; i + 1 < sinks_.size(); ++i) sinks_[i]->publish(key, payload);
            if (!sinks_.empty()) sinks_.back()->publish(key, std::move(payload));
        }

    private:
        std::vector<std::shared_ptr<IPublishSink> > sinks_;
    };
} // namespace lobsync
