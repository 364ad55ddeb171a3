#pragma once

#include "core/types.h"
#include <string>

namespace warden {
namespace sandbox {

// An isolation strategy. execute() never throws for failures of the
// analysis code itself; those come back as a status on the result.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    virtual core::SandboxStrategy strategy() const = 0;
    virtual bool isAvailable() const = 0;

    virtual core::ExecutionResult execute(const std::string& code,
                                          const core::DataContext& data,
                                          const core::ResourceLimits& limits,
                                          const core::CancellationToken* cancel = nullptr) = 0;

    const char* name() const { return core::strategyName(strategy()); }
};

// Placeholder when no strategy could be brought up. Fails closed.
class UnavailableSandbox : public Sandbox {
public:
    core::SandboxStrategy strategy() const override { return core::SandboxStrategy::UNAVAILABLE; }
    bool isAvailable() const override { return false; }

    core::ExecutionResult execute(const std::string&, const core::DataContext&,
                                  const core::ResourceLimits&,
                                  const core::CancellationToken* = nullptr) override {
        core::ExecutionResult result;
        result.status = core::ExecutionStatus::SANDBOX_UNAVAILABLE;
        result.strategy = core::SandboxStrategy::UNAVAILABLE;
        return result;
    }
};

}
}
