#include "lobsync/session/SessionRegistry.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <iostream>

#include "lobsync/md/Errors.hpp"

namespace lobsync {
    bool SessionRegistry::start(const std::string &session_id, Runner runner) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (shut_down_) {
                std::cerr << "[SessionRegistry] shut down, not starting " << session_id << "\n";
                return false;
            }
            if (open_.count(session_id) > 0 || starting_.count(session_id) > 0) {
                std::cerr << "[SessionRegistry] Warning: session " << session_id << " already opened!\n";
                return false;
            }
            starting_.insert(session_id);
        }

        std::cout << "[SessionRegistry] starting " << session_id << "\n";
        boost::asio::post(ioc_, std::move(runner));
        return true;
    }

    bool SessionRegistry::set_connecting(const std::string &session_id, CancelFn abort) {
        std::lock_guard<std::mutex> lk(mx_);
        if (shut_down_) return false;
        if (starting_.count(session_id) > 0) connecting_[session_id] = std::move(abort);
        return true;
    }

    bool SessionRegistry::register_open(const std::string &session_id) {
        std::lock_guard<std::mutex> lk(mx_);
        if (open_.count(session_id) > 0) {
            throw DuplicateSessionError(session_id);
        }
        if (shut_down_ || starting_.erase(session_id) == 0) {
            return false;
        }
        connecting_.erase(session_id);
        open_.insert(session_id);
        return true;
    }

    void SessionRegistry::release(const std::string &session_id) {
        std::lock_guard<std::mutex> lk(mx_);
        starting_.erase(session_id);
        connecting_.erase(session_id);
        open_.erase(session_id);
        pending_.erase(session_id);
    }

    bool SessionRegistry::is_open(const std::string &session_id) const {
        std::lock_guard<std::mutex> lk(mx_);
        return open_.count(session_id) > 0;
    }

    bool SessionRegistry::set_pending(const std::string &session_id, CancelFn cancel) {
        std::lock_guard<std::mutex> lk(mx_);
        if (open_.count(session_id) == 0) return false;
        pending_[session_id] = std::move(cancel);
        return true;
    }

    void SessionRegistry::clear_pending(const std::string &session_id) {
        std::lock_guard<std::mutex> lk(mx_);
        pending_.erase(session_id);
    }

    bool SessionRegistry::has_pending(const std::string &session_id) const {
        std::lock_guard<std::mutex> lk(mx_);
        return pending_.count(session_id) > 0;
    }

    void SessionRegistry::shutdown() {
        std::unordered_map<std::string, CancelFn> tmp;
        std::unordered_map<std::string, CancelFn> aborts;
        {
            std::lock_guard<std::mutex> lk(mx_);
            shut_down_ = true;
            tmp.swap(pending_);
            aborts.swap(connecting_);
            open_.clear();
            starting_.clear();
        }

        std::cout << "[SessionRegistry] closing all streams\n";
        // Cancel outside the lock: a transport may complete the receive inline.
        for (auto &[id, cancel]: tmp) {
            if (cancel) cancel();
        }
        for (auto &[id, abort]: aborts) {
            if (abort) abort();
        }
        std::cout << "[SessionRegistry] closed all streams (" << tmp.size() << " pending receives cancelled, "
                << aborts.size() << " connects aborted)\n";
    }

    bool SessionRegistry::is_shut_down() const {
        std::lock_guard<std::mutex> lk(mx_);
        return shut_down_;
    }

    std::size_t SessionRegistry::open_count() const {
        std::lock_guard<std::mutex> lk(mx_);
        return open_.size();
    }

    std::size_t SessionRegistry::pending_count() const {
        std::lock_guard<std::mutex> lk(mx_);
        return pending_.size();
    }

    std::vector<std::string> SessionRegistry::open_ids() const {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lk(mx_);
            ids.assign(open_.begin(), open_.end());
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }
} // namespace lobsync
