/**
 * @file main.cpp
 * @brief Terminal rain: drives RainSimulation at a fixed frame rate and draws the frame buffer with ncurses.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include "DemoScene.h"
#include "FrameEncoder.h"
#include "Logger.h"
#include "RainSimulation.h"
#include "SceneGeometry.h"
#include "SimConfig.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static void init_colors_rain();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_rain();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

// Pairs: 1 far rain, 2 mid rain, 3 near rain, 4 splash, 5 stream, 6 status line.
static void init_colors_rain() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(1, COLOR_BLUE, -1);
    init_pair(2, COLOR_CYAN, -1);
    init_pair(3, COLOR_WHITE, -1);
    init_pair(4, COLOR_WHITE, -1);
    init_pair(5, COLOR_CYAN, -1);
    init_pair(6, COLOR_YELLOW, -1);
}

// Glyph tables indexed by decoded variant.
static const char kTrailFar[FrameCodes::Trails]  = {'.', '\'', '\'', '`'};
static const char kTrailNear[FrameCodes::Trails] = {'|', '|', ':', '\''};
static const char kSplash[FrameCodes::SplashChars] = {'o', '^', '\'', ' ', '\\', '/', '.', ' '};
static const char kStream[FrameCodes::StreamSizes] = {'.', '-', '~', '='};

static void drawCell(int row, int col, uint8_t code) {
    CellCode c = FrameEncoder::decode(code);
    chtype ch = ' ';
    int pair = 0;
    bool bold = c.bucket >= FrameCodes::Buckets - 2;
    switch (c.kind) {
        case CellKind::Droplet:
            ch = static_cast<chtype>(c.bucket >= FrameCodes::Buckets / 2 ? kTrailNear[c.variant] : kTrailFar[c.variant]);
            pair = c.bucket < 3 ? 1 : c.bucket < 6 ? 2 : 3;
            break;
        case CellKind::Splash:
            ch = static_cast<chtype>(kSplash[c.variant]);
            pair = 4;
            break;
        case CellKind::Stream:
            ch = static_cast<chtype>(kStream[c.variant]);
            pair = 5;
            break;
        default:
            return;
    }
    if (ch == ' ') return;
    attr_t attr = has_colors() ? COLOR_PAIR(pair) : A_NORMAL;
    if (bold) attr |= A_BOLD;
    attron(attr);
    mvaddch(row, col, ch);
    attroff(attr);
}

static void drawFrame(const RainSimulation& sim) {
    erase();
    const std::vector<uint8_t>& buf = sim.buffer();
    const int w = sim.width();
    for (int y = 0; y < sim.height(); ++y) {
        for (int x = 0; x < w; ++x) {
            uint8_t code = buf[static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x)];
            if (code) drawCell(y, x, code);
        }
    }
}

static void drawStatusLine(const RainSimulation& sim, int row, int fps, bool running) {
    std::string s = std::string(running ? "[running]" : "[paused] ") +
                    " drops:" + std::to_string(sim.droplets().count()) +
                    " splashes:" + std::to_string(sim.splashPool().count()) +
                    " streams:" + std::to_string(sim.streamPool().count()) +
                    " fps:" + std::to_string(fps) +
                    "  p pause  +/- speed  r reset  q quit";
    int cols = getmaxx(stdscr);
    if (cols <= 0) return;
    if (static_cast<int>(s.size()) > cols) s.resize(static_cast<size_t>(cols));
    move(row, 0);
    clrtoeol();
    if (has_colors()) attron(COLOR_PAIR(6));
    mvaddnstr(row, 0, s.c_str(), cols);
    if (has_colors()) attroff(COLOR_PAIR(6));
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "rain");
    Logger::info("rain starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (rain)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (rain)"); }
            } else {
                Logger::error("std::terminate (rain): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });

    // Defaults, then environment, then flags.
    SimConfig cfg;
    HostOptions host;
    cfg.applyEnv();
    try {
        parseArgs(argc, argv, cfg, host);
    } catch (const std::exception& e) {
        Logger::logException("argument parsing", e);
        std::fprintf(stderr, "%s\n%s", e.what(), usageText(argc > 0 ? argv[0] : "rain").c_str());
        Logger::shutdown();
        return 1;
    }
    if (host.showHelp) {
        std::fputs(usageText(argc > 0 ? argv[0] : "rain").c_str(), stdout);
        Logger::shutdown();
        return 0;
    }
    cfg.validate();

    std::unique_ptr<SceneGeometry> scene;
    try {
        if (host.scenePath.empty()) {
            scene = std::make_unique<SceneGeometry>(makeDemoScene(160, 60));
            Logger::info("using built-in demo scene");
        } else {
            scene = std::make_unique<SceneGeometry>(SceneGeometry::loadFile(host.scenePath));
        }
    } catch (const std::exception& e) {
        Logger::logException("scene load", e);
        std::fprintf(stderr, "cannot load scene: %s\n", e.what());
        Logger::shutdown();
        return 1;
    }

    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_rain();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    // Last row is the status line; a 1-row terminal just gets an empty rain area.
    RainSimulation sim(*scene, cols, rows - 1, cfg);

    int fps = host.fps;
    bool running = true;
    bool done = false;
    using namespace std::chrono;
    auto nextFrame = steady_clock::now();
    while (!done) {
        if (g_stop) { Logger::info("stop signal received"); done = true; }
        if (g_needs_full_redraw) {
            drawFrame(sim);
            g_needs_full_redraw = 0;
        }

        auto now = steady_clock::now();
        if (running && now >= nextFrame) {
            sim.tick();
            drawFrame(sim);
            nextFrame = now + milliseconds(1000 / fps);
        } else if (!running) {
            nextFrame = now;
        }
        drawStatusLine(sim, std::max(0, rows - 1), fps, running);
        refresh();

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 'p': case 'P':
                running = !running; Logger::info(std::string("running = ") + (running ? "true" : "false")); break;
            case 'r': case 'R':
                sim.reset(); drawFrame(sim); break;
            case '+':
                fps = std::min(240, fps + 5); Logger::info("fps set: " + std::to_string(fps)); break;
            case '-':
                fps = std::max(1, fps - 5); Logger::info("fps set: " + std::to_string(fps)); break;
            case KEY_RESIZE:
                getmaxyx(stdscr, rows, cols);
                sim.resize(cols, rows - 1);
                clearok(stdscr, TRUE);
                drawFrame(sim);
                break;
            default:
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::max(1, std::min(16, 1000 / fps / 2))));
    }

    endwin();
    g_curses_inited = false;
    Logger::info("rain terminating after " + std::to_string(sim.ticks()) + " ticks");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (rain)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (rain)");
        Logger::shutdown();
        return 2;
    }
}
