// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/log.hpp>

namespace {

// Keep test output readable: only warnings and worse
class QuietLogListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(const Catch::TestRunInfo&) override {
        splicer::core::set_log_level(spdlog::level::warn);
    }
};

} // namespace

CATCH_REGISTER_LISTENER(QuietLogListener)
