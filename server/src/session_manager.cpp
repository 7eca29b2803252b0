#include "ferry/server/session_manager.hpp"

#include <utility>

namespace ferry::server
{

    void SessionManager::launch(std::uint64_t session_id, std::function<void()> work, std::function<void()> cancel)
    {
        reap_finished();

        // The worker blocks in finished() until its entry has been stored.
        std::lock_guard lock(mutex_);
        std::thread worker([this, session_id, work = std::move(work)]
                           {
                               work();
                               finished(session_id);
                           });
        sessions_[session_id] = Entry{std::move(cancel), std::move(worker)};
    }

    void SessionManager::finished(std::uint64_t session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            // join_all() already took the entry and joins the thread itself.
            return;
        }
        finished_.push_back(std::move(it->second.worker));
        sessions_.erase(it);
    }

    void SessionManager::reap_finished()
    {
        std::vector<std::thread> done;
        {
            std::lock_guard lock(mutex_);
            done.swap(finished_);
        }
        for (auto &worker : done)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void SessionManager::cancel_all()
    {
        std::lock_guard lock(mutex_);
        for (auto &[id, entry] : sessions_)
        {
            if (entry.cancel)
            {
                entry.cancel();
            }
        }
    }

    void SessionManager::join_all()
    {
        std::map<std::uint64_t, Entry> pending;
        {
            std::lock_guard lock(mutex_);
            pending.swap(sessions_);
        }
        for (auto &[id, entry] : pending)
        {
            if (entry.worker.joinable())
            {
                entry.worker.join();
            }
        }
        reap_finished();
    }

    std::size_t SessionManager::active_count()
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

} // namespace ferry::server
