// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Channel.hpp>
#include <core/Log.hpp>

#include <lode/Controller.hpp>
#include <lode/SingleShot.hpp>

#include <session/Orchestrator.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <print>
#include <string>
#include <vector>

#include <tui/InputField.hpp>
#include <tui/LogPanel.hpp>
#include <tui/Spinner.hpp>
#include <tui/StatusBar.hpp>
#include <tui/Terminal.hpp>
#include <tui/TextWrap.hpp>

namespace lode
{

namespace
{
    constexpr auto PollInterval = std::chrono::milliseconds(50);
    constexpr auto ShutdownGrace = std::chrono::milliseconds(1500);
    constexpr auto InputBoxHeight = 3;

    constexpr auto UserStyle = tui::Style { .fg = 2, .bold = true };
    constexpr auto SystemStyle = tui::Style { .fg = 8 };
    constexpr auto BorderStyle = tui::Style { .fg = 8 };
    constexpr auto ActiveBorderStyle = tui::Style { .fg = 6 };
    constexpr auto TitleStyle = tui::Style { .fg = 6, .bold = true };
    constexpr auto PlaceholderStyle = tui::Style { .fg = 8, .italic = true };

    auto repeat(std::string_view piece, int count) -> std::string
    {
        auto out = std::string {};
        for (auto i = 0; i < count; ++i)
            out += piece;
        return out;
    }

    auto toKeyHints() -> std::vector<tui::KeyHint>
    {
        return {
            { .key = "Enter", .action = "submit" },
            { .key = "Esc", .action = "stop" },
            { .key = "^L", .action = "logs" },
            { .key = "^C", .action = "quit" },
        };
    }
} // namespace

/// @brief Screen rows of each region, recomputed on every frame.
struct LayoutGeometry
{
    int chatTop = 1;
    int chatBottom = 1;
    int inputRow = 1;
    int logStartRow = 1;
    int statusRow = 1;
};

/// @brief A wrapped transcript row.
struct TranscriptLine
{
    std::string text;
    tui::Style style;
};

struct App::Impl
{
    AppConfig config;
    Channel<SessionEvent> events;
    Orchestrator orchestrator;
    Controller controller;

    tui::Terminal terminal;
    tui::InputField inputField;
    tui::LogPanel logPanel;
    tui::StatusBar statusBar;
    tui::Spinner spinner;
    LayoutGeometry geo;

    std::mutex logMutex;
    bool tuiActive = false;
    std::vector<tui::LogEntry> pendingLogs; ///< Messages logged before the screen was up.

    std::vector<TranscriptLine> transcript;
    std::uint64_t transcriptRevision = ~std::uint64_t { 0 };
    int transcriptWidth = 0;
    int transcriptScroll = 0; ///< Rows scrolled back from the newest line.

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        orchestrator(config.request,
                     makeWorkerLaunch(config.worker, StderrMode::Discard),
                     config.runsDir,
                     events),
        controller(config.request.autoDecide,
                   [this](SessionCommand command) { return orchestrator.submit(std::move(command)); })
    {
        statusBar.setHints(toKeyHints());
    }

    void onLog(log::Level level, std::string_view message)
    {
        auto const lock = std::lock_guard(logMutex);
        if (tuiActive)
            logPanel.addLog(level, std::string(message));
        else
            pendingLogs.push_back(tui::LogEntry { .level = level, .message = std::string(message) });
    }

    void activateLogPanel()
    {
        auto const lock = std::lock_guard(logMutex);
        tuiActive = true;
        for (auto& entry: pendingLogs)
            logPanel.addLog(entry.level, std::move(entry.message));
        pendingLogs.clear();
    }

    void deactivateLogPanel()
    {
        auto const lock = std::lock_guard(logMutex);
        tuiActive = false;
    }

    // --- Layout ---

    void computeGeometry()
    {
        auto const rows = terminal.output().rows();
        geo.statusRow = rows;
        geo.logStartRow = geo.statusRow - logPanel.totalHeight();
        geo.inputRow = geo.logStartRow - InputBoxHeight;
        geo.chatTop = 1;
        geo.chatBottom = std::max(geo.chatTop, geo.inputRow - 1);
    }

    [[nodiscard]] auto chatHeight() const -> int { return std::max(0, geo.chatBottom - geo.chatTop + 1); }

    void rebuildTranscript(int width)
    {
        if (transcriptRevision == controller.revision() && transcriptWidth == width)
            return;
        transcriptRevision = controller.revision();
        transcriptWidth = width;
        transcript.clear();

        for (auto const& message: controller.messages())
        {
            auto prefix = std::string_view {};
            auto style = tui::Style {};
            switch (message.role)
            {
                case MessageRole::User:
                    prefix = "> ";
                    style = UserStyle;
                    break;
                case MessageRole::Assistant: break;
                case MessageRole::System: style = SystemStyle; break;
            }

            auto const indent = std::string(prefix.size(), ' ');
            auto first = true;
            for (auto& line: tui::wordWrap(message.text, width - static_cast<int>(prefix.size())))
            {
                transcript.push_back(
                    TranscriptLine { .text = std::string(first ? prefix : indent) + line, .style = style });
                first = false;
            }
            transcript.push_back(TranscriptLine {});
        }
    }

    void scrollTranscript(int delta)
    {
        auto const maxScroll = std::max(0, static_cast<int>(transcript.size()) - chatHeight());
        transcriptScroll = std::clamp(transcriptScroll + delta, 0, maxScroll);
    }

    // --- Rendering ---

    void renderTranscript()
    {
        auto& out = terminal.output();
        auto const cols = out.columns();
        rebuildTranscript(std::max(1, cols - 2));

        auto const height = chatHeight();
        auto const total = static_cast<int>(transcript.size());
        transcriptScroll = std::clamp(transcriptScroll, 0, std::max(0, total - height));
        auto const first = std::max(0, total - height - transcriptScroll);

        for (auto row = 0; row < height; ++row)
        {
            out.moveTo(geo.chatTop + row, 1);
            out.clearLine();
            auto const index = first + row;
            if (index >= total)
                continue;
            out.writeRaw(" ");
            out.write(transcript[static_cast<std::size_t>(index)].text,
                      transcript[static_cast<std::size_t>(index)].style);
        }

        if (transcriptScroll > 0)
        {
            auto const marker = std::format(" ↑ {} more ", transcriptScroll);
            out.moveTo(geo.chatBottom, std::max(1, cols - tui::displayWidth(marker)));
            out.write(marker, tui::Style { .fg = 8, .inverse = true });
        }
    }

    [[nodiscard]] auto placeholder() const -> std::string_view
    {
        switch (controller.phase())
        {
            case Phase::Clarifying: return "Type your answer (Esc cancels)";
            case Phase::Confirming: return "yes / no";
            default: break;
        }
        if (!controller.inputEnabled())
            return "Research in progress, Esc to stop";
        return "Ask a research question";
    }

    void renderInputBox()
    {
        auto& out = terminal.output();
        auto const width = std::max(4, out.columns());
        auto const inner = width - 4;
        auto const border = controller.inputEnabled() ? ActiveBorderStyle : BorderStyle;

        auto const title = tui::truncate(controller.inputTitle(), std::max(0, inner - 2));
        out.moveTo(geo.inputRow, 1);
        out.clearLine();
        out.write("╭─ ", border);
        out.write(title, TitleStyle);
        out.write(" " + repeat("─", std::max(0, width - 5 - tui::displayWidth(title))) + "╮", border);

        out.moveTo(geo.inputRow + 1, 1);
        out.clearLine();
        out.write("│ ", border);
        auto const view = inputField.view(inner);
        if (inputField.text().empty())
            out.writePadded(tui::truncate(placeholder(), inner), inner, PlaceholderStyle);
        else
            out.writePadded(view.text, inner);
        out.write(" │", border);

        out.moveTo(geo.inputRow + 2, 1);
        out.clearLine();
        out.write("╰" + repeat("─", width - 2) + "╯", border);
    }

    void renderStatusBar()
    {
        statusBar.setPhase(std::string(phaseName(controller.phase())));
        statusBar.setStatus(controller.statusLine().value_or(""));
        statusBar.setBusyFrame(controller.isProcessing() ? spinner.currentFrame() : std::string_view {});
        statusBar.render(terminal.output(), geo.statusRow, terminal.output().columns());
    }

    void placeCursor()
    {
        auto& out = terminal.output();
        if (!controller.inputEnabled())
        {
            out.setCursorVisible(false);
            return;
        }
        auto const view = inputField.view(std::max(0, out.columns() - 4));
        out.moveTo(geo.inputRow + 1, 3 + view.cursorColumn);
        out.setCursorVisible(true);
    }

    void renderFrame(bool clear)
    {
        auto& out = terminal.output();
        auto sync = out.syncGuard();
        out.setCursorVisible(false);
        if (clear)
            out.clearScreen();
        computeGeometry();
        renderTranscript();
        renderInputBox();
        logPanel.render(out, geo.logStartRow, out.columns());
        renderStatusBar();
        placeCursor();
        out.flush();
    }

    // --- Input ---

    /// @return False when the user asked to quit.
    [[nodiscard]] auto handleInput(tui::InputEvent const& event, bool& clear) -> bool
    {
        if (std::holds_alternative<tui::ResizeEvent>(event))
        {
            clear = true;
            return true;
        }

        if (auto const* mouse = std::get_if<tui::MouseEvent>(&event))
        {
            auto const inLogPanel = mouse->y >= geo.logStartRow && mouse->y < geo.statusRow;
            switch (mouse->type)
            {
                case tui::MouseEvent::Type::Press:
                    if (logPanel.handleClick(mouse->y, geo.logStartRow))
                        clear = true;
                    break;
                case tui::MouseEvent::Type::ScrollUp:
                    if (inLogPanel)
                        logPanel.scrollUp();
                    else
                        scrollTranscript(3);
                    break;
                case tui::MouseEvent::Type::ScrollDown:
                    if (inLogPanel)
                        logPanel.scrollDown();
                    else
                        scrollTranscript(-3);
                    break;
            }
            return true;
        }

        if (auto const* key = std::get_if<tui::KeyEvent>(&event))
        {
            auto const page = std::max(1, chatHeight() - 1);
            switch (key->key)
            {
                case tui::KeyCode::Escape: controller.requestStop(); return true;
                case tui::KeyCode::Up: scrollTranscript(1); return true;
                case tui::KeyCode::Down: scrollTranscript(-1); return true;
                case tui::KeyCode::PageUp: scrollTranscript(page); return true;
                case tui::KeyCode::PageDown: scrollTranscript(-page); return true;
                default: break;
            }
            if (key->isCtrl('l'))
            {
                logPanel.toggle();
                clear = true;
                return true;
            }
            if (key->isCtrl('c') || (key->isCtrl('d') && inputField.text().empty()))
                return false;
        }

        if (!controller.inputEnabled())
            return true;

        switch (inputField.processEvent(event))
        {
            case tui::InputFieldAction::Submit: return submit();
            case tui::InputFieldAction::Abort:
            case tui::InputFieldAction::Eof: return false;
            case tui::InputFieldAction::Changed:
            case tui::InputFieldAction::None: break;
        }
        return true;
    }

    [[nodiscard]] auto submit() -> bool
    {
        auto line = std::string(inputField.text());
        switch (controller.submitLine(line))
        {
            case SubmitResult::Quit: return false;
            case SubmitResult::Accepted:
                inputField.addHistory(std::move(line));
                inputField.clear();
                transcriptScroll = 0;
                break;
            case SubmitResult::Ignored: break;
        }
        return true;
    }
};

// Messages are queued until the screen is up, then go to the log panel.
App::App(AppConfig config):
    _impl(std::make_unique<Impl>(std::move(config))),
    _logSink([impl = _impl.get()](log::Level level, std::string_view message) { impl->onLog(level, message); })
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const configPath = defaultConfigPath();
    if (!std::filesystem::exists(configPath))
    {
        if (auto saved = saveConfigToFile(configPath, _impl->config); saved)
            log::info("Config file created at {}", configPath);
        else
            log::warning("Failed to save config file: {}", saved.error().message);
    }

    _impl->orchestrator.start();
    log::info("Worker: {}", _impl->config.worker.command);
    log::info("Artifacts go to {}", std::filesystem::absolute(_impl->config.runsDir).string());
    return {};
}

auto App::run() -> int
{
    std::cout.flush();

    if (auto initialized = _impl->terminal.initialize(); !initialized)
    {
        std::println(stderr, "Failed to initialize terminal: {}", initialized.error().message);
        _impl->orchestrator.shutdown(std::chrono::milliseconds(0));
        return 1;
    }

    auto& output = _impl->terminal.output();
    output.setAltScreen(true);
    output.flush();

    _impl->activateLogPanel();
    if (_impl->config.logPanelExpanded)
        _impl->logPanel.setExpanded(true);
    log::info("Type /help for commands, /quit to exit");

    _impl->renderFrame(true);

    auto lastRevision = _impl->controller.revision();
    auto running = true;
    while (running)
    {
        auto dirty = false;
        auto clear = false;

        for (auto const& event: _impl->terminal.poll(static_cast<int>(PollInterval.count())))
        {
            dirty = true;
            if (!_impl->handleInput(event, clear))
            {
                running = false;
                break;
            }
        }

        for (auto const& event: _impl->events.drain())
            _impl->controller.apply(event);

        if (_impl->controller.revision() != lastRevision)
        {
            lastRevision = _impl->controller.revision();
            dirty = true;
        }
        if (_impl->logPanel.takeDirty())
            dirty = true;
        if (_impl->controller.isProcessing() && _impl->spinner.tick())
            dirty = true;

        if (running && dirty)
            _impl->renderFrame(clear);
    }

    _impl->orchestrator.shutdown(ShutdownGrace);

    _impl->deactivateLogPanel();
    output.setCursorVisible(true);
    output.setAltScreen(false);
    output.flush();
    _impl->terminal.shutdown();
    return 0;
}

} // namespace lode
