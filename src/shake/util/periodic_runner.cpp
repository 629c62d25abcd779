/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#define SHAKE_LOGV2_DEFAULT_COMPONENT ::shake::logv2::LogComponent::kControl

#include "shake/util/periodic_runner.h"

#include <condition_variable>
#include <mutex>
#include <thread>

#include "shake/logv2/log.h"
#include "shake/util/assert_util.h"

namespace shake {

class PeriodicJobAnchor::Impl {
public:
    explicit Impl(PeriodicRunner::PeriodicJob job) : _job(std::move(job)) {}

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lk(_mutex);
        invariant(_state == State::kNotScheduled);
        _state = State::kRunning;
        _thread = std::thread([this] { _run(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(_mutex);
            if (_state != State::kRunning)
                return;
            _state = State::kStopped;
        }
        _stopCondVar.notify_all();

        if (!_thread.joinable())
            return;
        if (_thread.get_id() == std::this_thread::get_id()) {
            // Stopped from within the job itself; the loop exits once the current run returns.
            _thread.detach();
        } else {
            _thread.join();
        }
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lk(_mutex);
        return _state == State::kRunning;
    }

    const std::string& name() const {
        return _job.name;
    }

private:
    enum class State { kNotScheduled, kRunning, kStopped };

    void _run() {
        logv2::setThreadName(_job.name);
        LOGV2_DEBUG(4615601, 1, "Periodic job started", "job"_attr = _job.name);

        std::unique_lock<std::mutex> lk(_mutex);
        while (_state == State::kRunning) {
            lk.unlock();
            _job.job();
            lk.lock();

            _stopCondVar.wait_for(lk, _job.interval, [&] { return _state != State::kRunning; });
        }

        LOGV2_DEBUG(4615602, 1, "Periodic job stopped", "job"_attr = _job.name);
    }

    PeriodicRunner::PeriodicJob _job;

    mutable std::mutex _mutex;
    std::condition_variable _stopCondVar;
    State _state = State::kNotScheduled;
    std::thread _thread;
};

PeriodicJobAnchor PeriodicRunner::makeJob(PeriodicJob job) {
    return PeriodicJobAnchor(std::make_shared<PeriodicJobAnchor::Impl>(std::move(job)));
}

PeriodicJobAnchor::PeriodicJobAnchor(std::shared_ptr<Impl> impl) : _impl(std::move(impl)) {}

PeriodicJobAnchor& PeriodicJobAnchor::operator=(PeriodicJobAnchor&& other) {
    if (this != &other) {
        stop();
        _impl = std::move(other._impl);
    }
    return *this;
}

PeriodicJobAnchor::~PeriodicJobAnchor() {
    stop();
}

void PeriodicJobAnchor::start() {
    invariant(_impl);
    _impl->start();
}

void PeriodicJobAnchor::stop() {
    if (_impl)
        _impl->stop();
}

bool PeriodicJobAnchor::isRunning() const {
    return _impl && _impl->isRunning();
}

std::string PeriodicJobAnchor::getName() const {
    return _impl ? _impl->name() : std::string();
}

}  // namespace shake
