#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace ferry::server
{

    // Owns the worker thread of every live session so shutdown can cancel and
    // join them. Workers that have finished are joined on the next launch() or
    // in join_all(), never detached.
    class SessionManager
    {
    public:
        // Runs `work` on a dedicated thread; `cancel` is invoked by cancel_all().
        void launch(std::uint64_t session_id, std::function<void()> work, std::function<void()> cancel);

        void cancel_all();
        void join_all();
        std::size_t active_count();

    private:
        // Called from the session's own thread when its work returned.
        void finished(std::uint64_t session_id);
        void reap_finished();

        struct Entry
        {
            std::function<void()> cancel;
            std::thread worker;
        };

        std::mutex mutex_;
        std::map<std::uint64_t, Entry> sessions_;
        std::vector<std::thread> finished_;
    };

} // namespace ferry::server
