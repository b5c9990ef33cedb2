// Helpers shared by the matrixrun test executables.
#pragma once

#include "matrixrun/executor.h"

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace matrixrun::testing {

struct Run {
    int  failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
    int finish() const {
        if (failures) {
            std::cerr << "Total failures: " << failures << "\n";
            return 1;
        }
        return 0;
    }
};

inline CommandResult ok(std::string output = {}) {
    CommandResult r;
    r.launched    = true;
    r.exit_status = 0;
    r.output      = std::move(output);
    return r;
}

inline CommandResult exit_with(int status, std::string output = {}) {
    CommandResult r;
    r.launched    = true;
    r.exit_status = status;
    r.output      = std::move(output);
    return r;
}

struct RecordedCall {
    std::string               command;
    CellEnvironment           env;
    std::chrono::milliseconds timeout{0};
};

// Executor whose behaviour is a callback; records every call.
class ScriptedExecutor final : public CommandExecutor {
  public:
    using Script = std::function<CommandResult(std::string_view command, const CellEnvironment &env)>;

    explicit ScriptedExecutor(Script script) : script_(std::move(script)) {}

    CommandResult execute(std::string_view command, const CellEnvironment &env, std::chrono::milliseconds timeout) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            calls_.push_back(RecordedCall{std::string(command), env, timeout});
        }
        return script_(command, env);
    }

    std::vector<RecordedCall> calls() const {
        std::lock_guard<std::mutex> lock(mu_);
        return calls_;
    }

  private:
    Script                    script_;
    mutable std::mutex        mu_;
    std::vector<RecordedCall> calls_;
};

inline const std::string *find_env(const CellEnvironment &env, std::string_view key) {
    const std::string *found = nullptr;
    for (const auto &v : env.vars) {
        if (v.key == key)
            found = &v.value;
    }
    return found;
}

} // namespace matrixrun::testing
