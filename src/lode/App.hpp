// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <lode/Config.hpp>

#include <memory>

namespace lode
{

/// @brief The interactive full-screen front end.
///
/// Wires the terminal, the Controller and the Orchestrator together and runs
/// the render loop on the calling thread.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Starts the background orchestrator.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs until the user quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
    log::ScopedSink _logSink; ///< Routes diagnostics into the log panel while the app lives.
};

} // namespace lode
