/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_INDEX_CHECKPOINT_WRITER_HPP
#define FT_MIGRATOR_INDEX_CHECKPOINT_WRITER_HPP

#include <condition_variable>
#include <thread>
#include <fm/index/checkpoint.hpp>
#include <fm/mutex.hpp>

namespace ft_migrator::index {
    // Persists checkpoint snapshots from a single background thread.
    // At most one save is in flight and a newer pending snapshot replaces an older one.
    struct checkpoint_writer {
        explicit checkpoint_writer(std::string path);
        ~checkpoint_writer();

        checkpoint_writer(const checkpoint_writer &) =delete;
        checkpoint_writer &operator=(const checkpoint_writer &) =delete;

        void submit(checkpoint &&snapshot);
        // Blocks until every submitted snapshot is on disk; throws if the last save failed
        void flush();

        size_t num_saves() const;

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        const std::string _path;
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        std::condition_variable _cv {};
        std::optional<checkpoint> _pending {};
        bool _busy = false;
        bool _stop = false;
        size_t _num_saves = 0;
        std::optional<std::string> _last_error {};
        std::thread _worker;

        void _run();
    };
}

#endif // !FT_MIGRATOR_INDEX_CHECKPOINT_WRITER_HPP
