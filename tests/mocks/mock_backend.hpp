#pragma once

#include "gateway/ibackend.hpp"
#include "mocks/mock_transport.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate::testing {

/**
 * @brief Backend handing out MockTransports; keeps every transport it created
 */
class MockBackend : public IBackend {
public:
    explicit MockBackend(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::string type() const override { return "mock"; }

    void initialize() override {
        if (fail_initialize_) {
            throw std::runtime_error("mock backend unavailable");
        }
    }

    [[nodiscard]] std::shared_ptr<IBackendTransport> create_transport() override {
        auto transport = std::make_shared<MockTransport>();
        std::lock_guard<std::mutex> lock(mutex_);
        transport->set_succeed(!fail_sends_);
        created_.push_back(transport);
        return transport;
    }

    void set_fail_initialize(bool v) { fail_initialize_ = v; }

    /// Applies to transports created from now on
    void set_fail_sends(bool v) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = v;
    }

    [[nodiscard]] std::vector<std::shared_ptr<MockTransport>> created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

private:
    std::string name_;
    bool fail_initialize_ = false;

    mutable std::mutex mutex_;
    bool fail_sends_ = false;
    std::vector<std::shared_ptr<MockTransport>> created_;
};

} // namespace mcpgate::testing
