#pragma once

#include "famicore/input_types.hpp"

#include <map>
#include <string>
#include <vector>

union SDL_Event;
struct _SDL_GameController;
typedef struct _SDL_GameController SDL_GameController;

namespace famicore::app {

// Maps keyboard and gamepad state to the controller 1 button byte
class InputManager {
public:
    InputManager();
    ~InputManager();

    // Disable copy
    InputManager(const InputManager&) = delete;
    InputManager& operator=(const InputManager&) = delete;

    // Initialize input system, loading bindings from config_path if present
    bool initialize(const std::string& config_path);

    // Shutdown
    void shutdown();

    // Process SDL events for input (controller hotplug)
    void process_event(const SDL_Event& event);

    // Update input state (call once per frame)
    void update();

    // Current pad state as BUTTON_* bits
    uint8_t get_button_state() const { return m_button_state; }
    bool is_button_pressed(PadButton button) const;

    // Input binding configuration
    void set_binding(PadButton button, const InputBinding& binding);
    const InputBinding* get_binding(PadButton button) const;
    void load_default_bindings();

    bool save_config() const;
    bool load_config();

    static std::string get_button_name(PadButton button);

private:
    void open_controller(int device_index);
    void close_controller(int instance_id);
    void update_button_state();
    bool is_binding_pressed(const InputBinding& binding) const;

    uint8_t m_button_state = 0;

    // Keyboard state
    const uint8_t* m_keyboard_state = nullptr;
    int m_keyboard_state_count = 0;

    // Connected controllers
    struct ControllerInfo {
        SDL_GameController* controller;
        int instance_id;
        std::string name;
    };
    std::vector<ControllerInfo> m_controllers;

    std::map<PadButton, InputBinding> m_bindings;
    std::string m_config_path;
};

} // namespace famicore::app
