/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>

#include "Utils/Logger.hpp"

using namespace PhishGuard::Utils;

class DetailedTestListener : public ::testing::TestEventListener {
    ::testing::TestEventListener* default_;
    std::chrono::steady_clock::time_point testStart_;
    std::chrono::steady_clock::time_point suiteStart_;
    int total_ = 0, passed_ = 0, failed_ = 0;
public:
    explicit DetailedTestListener(::testing::TestEventListener* d) : default_(d) {}
    ~DetailedTestListener() override { delete default_; }

    void OnTestProgramStart(const ::testing::UnitTest& u) override {
        default_->OnTestProgramStart(u);
        std::cout << "\n========================================================================\n"
            << "  PhishGuard Test Suite\n"
            << "========================================================================\n\n";
    }
    void OnTestIterationStart(const ::testing::UnitTest& u, int it) override {
        default_->OnTestIterationStart(u, it);
    }
    void OnTestSuiteStart(const ::testing::TestSuite& s) override {
        default_->OnTestSuiteStart(s);
        suiteStart_ = std::chrono::steady_clock::now();
    }
    void OnTestStart(const ::testing::TestInfo& i) override {
        default_->OnTestStart(i);
        testStart_ = std::chrono::steady_clock::now();
    }
    void OnTestPartResult(const ::testing::TestPartResult& r) override {
        default_->OnTestPartResult(r);
    }
    void OnTestEnd(const ::testing::TestInfo& i) override {
        default_->OnTestEnd(i);
        ++total_;
        if (i.result()->Passed()) {
            ++passed_;
        } else {
            ++failed_;
            const auto dur = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - testStart_);
            std::cout << "  >> failed after " << dur.count() << " us\n";
        }
    }
    void OnTestSuiteEnd(const ::testing::TestSuite& s) override {
        default_->OnTestSuiteEnd(s);
        const auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - suiteStart_);
        std::cout << "  Suite " << s.name() << ": " << s.successful_test_count() << "/"
            << s.total_test_count() << " passed (" << dur.count() << " ms)\n\n";
    }
    void OnTestIterationEnd(const ::testing::UnitTest& u, int it) override {
        default_->OnTestIterationEnd(u, it);
        auto pct = [](int a, int b) { return b ? (100.0 * a / b) : 0.0; };
        std::cout << "========================================================================\n"
            << "  Total:  " << total_ << "\n"
            << "  Passed: " << std::setw(4) << passed_
            << " (" << std::fixed << std::setprecision(1) << pct(passed_, total_) << "%)\n"
            << "  Failed: " << std::setw(4) << failed_
            << " (" << std::fixed << std::setprecision(1) << pct(failed_, total_) << "%)\n"
            << "========================================================================\n";
    }
    void OnTestProgramEnd(const ::testing::UnitTest& u) override { default_->OnTestProgramEnd(u); }
    void OnEnvironmentsSetUpStart(const ::testing::UnitTest& u) override { default_->OnEnvironmentsSetUpStart(u); }
    void OnEnvironmentsSetUpEnd(const ::testing::UnitTest& u) override { default_->OnEnvironmentsSetUpEnd(u); }
    void OnEnvironmentsTearDownStart(const ::testing::UnitTest& u) override { default_->OnEnvironmentsTearDownStart(u); }
    void OnEnvironmentsTearDownEnd(const ::testing::UnitTest& u) override { default_->OnEnvironmentsTearDownEnd(u); }
};

int main(int argc, char** argv) {
    LoggerConfig cfg{};
    cfg.toConsole = true;
    cfg.toFile = false;
    cfg.async = false;          // Keep synchronous in test mode
    cfg.minimalLevel = LogLevel::Warn;
    cfg.flushLevel = LogLevel::Error;
    try {
        Logger::Instance().Initialize(cfg);
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger exception: " << ex.what() << "\n";
        return 1;
    }

    if (!Logger::Instance().IsInitialized()) {
        std::cerr << "[FATAL] Logger not initialized\n";
        return 1;
    }

    ::testing::InitGoogleTest(&argc, argv);

    auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
    auto* defaultPrinter = listeners.Release(listeners.default_result_printer());
    listeners.Append(new DetailedTestListener(defaultPrinter));

    int result = 0;
    try {
        result = RUN_ALL_TESTS();
    }
    catch (const std::exception& ex) {
        std::cerr << "[UNCAUGHT EXCEPTION] " << ex.what() << "\n";
        result = 1;
    }

    Logger::Instance().ShutDown();
    return result;
}
