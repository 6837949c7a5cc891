/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/index/checkpoint-writer.hpp>
#include <fm/logger.hpp>
#include <fm/timer.hpp>

namespace ft_migrator::index {
    checkpoint_writer::checkpoint_writer(std::string path)
        : _path { std::move(path) }, _worker { [this] { _run(); } }
    {
    }

    checkpoint_writer::~checkpoint_writer()
    {
        {
            mutex::scoped_lock lk { _mutex };
            _stop = true;
        }
        _cv.notify_all();
        _worker.join();
    }

    void checkpoint_writer::submit(checkpoint &&snapshot)
    {
        {
            mutex::scoped_lock lk { _mutex };
            if (_stop)
                throw error("checkpoint writer for {} is stopped", _path);
            _pending = std::move(snapshot);
        }
        _cv.notify_all();
    }

    void checkpoint_writer::flush()
    {
        mutex::unique_lock lk { _mutex };
        _cv.wait(lk, [&] { return !_pending && !_busy; });
        if (_last_error)
            throw error("failed to save checkpoint {}: {}", _path, *_last_error);
    }

    size_t checkpoint_writer::num_saves() const
    {
        mutex::scoped_lock lk { _mutex };
        return _num_saves;
    }

    void checkpoint_writer::_run()
    {
        mutex::unique_lock lk { _mutex };
        for (;;) {
            _cv.wait(lk, [&] { return _pending || _stop; });
            // pending snapshots are written even when stopping
            if (!_pending)
                break;
            auto snapshot = std::move(*_pending);
            _pending.reset();
            _busy = true;
            lk.unlock();
            std::optional<std::string> err {};
            try {
                timer t { fmt::format("save checkpoint {}", _path), logger::level::debug };
                snapshot.save(_path);
            } catch (const std::exception &ex) {
                logger::error("failed to save checkpoint {}: {}", _path, ex.what());
                err.emplace(ex.what());
            }
            lk.lock();
            _busy = false;
            _last_error = std::move(err);
            if (!_last_error)
                ++_num_saves;
            _cv.notify_all();
        }
    }
}
