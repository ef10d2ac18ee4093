#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lobsync/abstract/PublishSink.hpp"

namespace lobsync {
    /**
     * @brief Latest payload per key, readable from any thread.
     */
    class MemoryPublishSink final : public IPublishSink {
    public:
        void publish(std::string_view key, std::string payload) override {
            std::lock_guard<std::mutex> lk(mx_);
            latest_[std::string(key)] = std::move(payload);
            ++writes_;
        }

        [[nodiscard]] std::optional<std::string> latest(std::string_view key) const {
            std::lock_guard<std::mutex> lk(mx_);
            const auto it = latest_.find(std::string(key));
            if (it == latest_.end()) return std::nullopt;
            return it->second;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard<std::mutex> lk(mx_);
            return latest_.size();
        }

        [[nodiscard]] std::size_t writes() const {
            std::lock_guard<std::mutex> lk(mx_);
            return writes_;
        }

    private:
        mutable std::mutex mx_;
        std::unordered_map<std::string, std::string> latest_;
        std::size_t writes_{0};
    };
} // namespace lobsync
