#include "application.hpp"
#include "window_manager.hpp"
#include "renderer.hpp"
#include "input_manager.hpp"

#include "famicore/console.hpp"
#include "debug.hpp"

#include <SDL.h>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace famicore::app {

namespace {
constexpr double NTSC_FRAME_RATE = 60.0988;
}

Application::Application()
    : m_console(std::make_unique<Console>()) {
}

Application::~Application() = default;

void Application::print_usage(const char* program_name) {
    std::cout << "famicore - NES emulator\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] [ROM_FILE]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help        Show this help message and exit\n";
    std::cout << "  -v, --version     Show version information and exit\n";
    std::cout << "  -d, --debug       Log unusual bus and CPU events to stderr\n";
    std::cout << "  -t, --trace       Print a CPU trace line per instruction to stdout\n";
    std::cout << "  -c, --config DIR  Directory for famicore.json and input.json (default: config)\n";
    std::cout << "\n";
    std::cout << "ROM_FILE:\n";
    std::cout << "  Optional iNES (.nes) file to load on startup. Files can also be\n";
    std::cout << "  dropped onto the window.\n";
    std::cout << "\n";
    std::cout << "Keys:\n";
    std::cout << "  Escape  Pause/resume      Ctrl+R  Reset\n";
    std::cout << "  F       Frame advance     F11     Toggle fullscreen\n";
    std::cout << "  F12     Save screenshot   Alt+1..4  Window scale\n";
}

void Application::print_version() {
    std::cout << "famicore v0.1.0\n";
    std::cout << "Mappers: NROM (0), UxROM (2), CNROM (3), AxROM (7)\n";
}

bool Application::parse_command_line(int argc, char* argv[], std::string& rom_path) {
    rom_path.clear();

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            m_exit_requested = true;
            return true;
        }
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            m_exit_requested = true;
            return true;
        }
        else if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--debug") == 0) {
            set_debug_mode(true);
            std::cout << "Debug mode enabled\n";
        }
        else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--trace") == 0) {
            m_trace = true;
        }
        else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing directory after " << arg << "\n";
                return false;
            }
            m_config_dir = argv[++i];
        }
        else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else {
            rom_path = arg;
        }
    }

    return true;
}

std::string Application::settings_path() const {
    return m_config_dir + "/famicore.json";
}

std::string Application::input_config_path() const {
    return m_config_dir + "/input.json";
}

bool Application::initialize(int argc, char* argv[]) {
    std::string rom_path;
    if (!parse_command_line(argc, argv, rom_path)) {
        return false;
    }
    if (m_exit_requested) {
        return true;
    }

    m_settings.load(settings_path());

    if (m_trace) {
        m_console->set_trace_callback([](const std::string& line) {
            std::cout << line << '\n';
        });
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) < 0) {
        std::cerr << "Failed to initialize SDL: " << SDL_GetError() << std::endl;
        return false;
    }
    m_initialized = true;

    m_window_manager = std::make_unique<WindowManager>();
    m_renderer = std::make_unique<Renderer>();
    m_input_manager = std::make_unique<InputManager>();

    WindowConfig window_config;
    window_config.title = "famicore";
    window_config.scale = m_settings.scale;
    window_config.fullscreen = m_settings.fullscreen;
    window_config.vsync = m_settings.vsync;

    if (!m_window_manager->initialize(window_config)) {
        std::cerr << "Failed to initialize window manager" << std::endl;
        return false;
    }

    if (!m_renderer->initialize()) {
        std::cerr << "Failed to initialize renderer" << std::endl;
        return false;
    }

    if (!m_input_manager->initialize(input_config_path())) {
        std::cerr << "Failed to initialize input manager" << std::endl;
        return false;
    }

    if (!rom_path.empty()) {
        load_rom(rom_path);
    }

    std::cout << "famicore initialized successfully" << std::endl;
    return true;
}

void Application::run() {
    if (!m_initialized) return;

    const double target_frame_time = 1.0 / NTSC_FRAME_RATE;
    const double frequency = static_cast<double>(WindowManager::get_performance_frequency());

    while (!m_quit_requested) {
        uint64_t frame_start = WindowManager::get_ticks();

        process_events();
        m_input_manager->update();

        if (!m_paused || m_frame_advance_requested) {
            run_emulation_frame();
            m_frame_advance_requested = false;
        }

        render();

        // Sleep to maintain target frame rate
        uint64_t frame_end = WindowManager::get_ticks();
        double frame_time = static_cast<double>(frame_end - frame_start) / frequency;
        if (frame_time < target_frame_time) {
            double sleep_time = (target_frame_time - frame_time) * 1000.0;
            SDL_Delay(static_cast<uint32_t>(sleep_time));
        }
    }
}

void Application::shutdown() {
    if (!m_initialized) return;

    m_settings.fullscreen = m_window_manager->is_fullscreen();
    m_settings.scale = m_window_manager->get_scale();
    m_settings.save(settings_path());
    m_input_manager->save_config();

    m_console->unload();
    m_input_manager->shutdown();
    m_renderer->shutdown();
    m_window_manager->shutdown();

    SDL_Quit();
    m_initialized = false;

    std::cout << "famicore shutdown complete" << std::endl;
}

void Application::process_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        m_input_manager->process_event(event);
        m_window_manager->process_event(event);

        switch (event.type) {
            case SDL_QUIT:
                m_quit_requested = true;
                break;

            case SDL_WINDOWEVENT:
                if (event.window.event == SDL_WINDOWEVENT_CLOSE) {
                    m_quit_requested = true;
                }
                break;

            case SDL_KEYDOWN:
                if (event.key.repeat) break;
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        toggle_pause();
                        break;
                    case SDLK_r:
                        if (event.key.keysym.mod & KMOD_CTRL) {
                            reset();
                        }
                        break;
                    case SDLK_f:
                        if (!(event.key.keysym.mod & KMOD_CTRL)) {
                            frame_advance();
                        }
                        break;
                    case SDLK_F11:
                        m_window_manager->toggle_fullscreen();
                        break;
                    case SDLK_F12:
                        save_screenshot();
                        break;
                    case SDLK_1:
                    case SDLK_2:
                    case SDLK_3:
                    case SDLK_4:
                        if (event.key.keysym.mod & KMOD_ALT) {
                            m_window_manager->set_scale(event.key.keysym.sym - SDLK_0);
                        }
                        break;
                }
                break;

            case SDL_DROPFILE:
                load_rom(event.drop.file);
                SDL_free(event.drop.file);
                break;
        }
    }
}

void Application::run_emulation_frame() {
    if (!m_console->is_loaded()) {
        return;
    }

    m_console->set_controller_state(0, m_input_manager->get_button_state());

    if (!m_console->run_frame() && is_debug_mode()) {
        fprintf(stderr, "[famicore] frame budget exhausted at cycle %llu\n",
                static_cast<unsigned long long>(m_console->get_cycle_count()));
    }

    m_renderer->upload(m_console->get_framebuffer());
}

void Application::render() {
    m_renderer->draw(m_window_manager->get_drawable_width(),
                     m_window_manager->get_drawable_height());
    m_window_manager->swap_buffers();
}

bool Application::load_rom(const std::string& path) {
    std::cout << "Loading ROM: " << path << std::endl;

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        std::cerr << "Failed to open file: " << path << std::endl;
        return false;
    }

    std::streamoff size = file.tellg();
    if (size <= 0) {
        std::cerr << "Empty file: " << path << std::endl;
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        std::cerr << "Failed to read file: " << path << std::endl;
        return false;
    }

    if (!m_console->load_rom(data.data(), data.size())) {
        std::cerr << "Failed to load ROM: " << to_string(m_console->get_last_error()) << std::endl;
        return false;
    }

    m_rom_path = path;
    if (m_window_manager) {
        m_window_manager->set_title("famicore - " + path);
    }

    m_paused = m_settings.pause_on_load;

    std::cout << "ROM loaded successfully" << std::endl;
    return true;
}

void Application::resume() {
    if (m_console->is_loaded()) {
        m_paused = false;
    }
}

void Application::reset() {
    if (m_console->is_loaded()) {
        m_console->reset();
        std::cout << "Console reset" << std::endl;
    }
}

void Application::toggle_pause() {
    if (m_paused) {
        resume();
    } else {
        pause();
    }
}

bool Application::save_screenshot() {
    if (!m_console->is_loaded()) {
        return false;
    }

    std::filesystem::path dir = std::filesystem::path(m_config_dir) / "screenshots";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Failed to create " << dir.string() << ": " << ec.message() << std::endl;
        return false;
    }

    std::string stem = std::filesystem::path(m_rom_path).stem().string();
    std::string path = (dir / (stem + "_" + std::to_string(m_console->get_frame_count()) + ".bmp")).string();

    // The frame is RGBA8888 with R in the lowest byte
    const FrameBuffer& fb = m_console->get_framebuffer();
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormatFrom(
        const_cast<uint32_t*>(fb.data()), fb.width(), fb.height(), 32,
        fb.width() * static_cast<int>(sizeof(uint32_t)), SDL_PIXELFORMAT_ABGR8888);
    if (!surface) {
        std::cerr << "Failed to create screenshot surface: " << SDL_GetError() << std::endl;
        return false;
    }

    bool saved = SDL_SaveBMP(surface, path.c_str()) == 0;
    if (saved) {
        std::cout << "Saved screenshot: " << path << std::endl;
    } else {
        std::cerr << "Failed to save screenshot: " << SDL_GetError() << std::endl;
    }
    SDL_FreeSurface(surface);
    return saved;
}

void Application::frame_advance() {
    if (m_console->is_loaded()) {
        m_paused = true;
        m_frame_advance_requested = true;
    }
}

} // namespace famicore::app
