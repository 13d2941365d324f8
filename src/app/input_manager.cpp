#include "input_manager.hpp"

#include <SDL.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace famicore::app {

InputManager::InputManager() = default;

InputManager::~InputManager() {
    shutdown();
}

bool InputManager::initialize(const std::string& config_path) {
    m_config_path = config_path;
    m_keyboard_state = SDL_GetKeyboardState(&m_keyboard_state_count);

    load_default_bindings();

    // Open any connected controllers
    int num_joysticks = SDL_NumJoysticks();
    for (int i = 0; i < num_joysticks; i++) {
        if (SDL_IsGameController(i)) {
            open_controller(i);
        }
    }

    // Saved bindings override the defaults
    load_config();

    std::cout << "Input manager initialized with " << m_controllers.size()
              << " controller(s)" << std::endl;
    return true;
}

void InputManager::shutdown() {
    for (auto& controller : m_controllers) {
        if (controller.controller) {
            SDL_GameControllerClose(controller.controller);
        }
    }
    m_controllers.clear();
}

void InputManager::load_default_bindings() {
    m_bindings.clear();
    m_bindings[PadButton::Up] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_UP, 0.5f, true};
    m_bindings[PadButton::Down] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_DOWN, 0.5f, true};
    m_bindings[PadButton::Left] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_LEFT, 0.5f, true};
    m_bindings[PadButton::Right] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_RIGHT, 0.5f, true};
    m_bindings[PadButton::A] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_Z, 0.5f, true};
    m_bindings[PadButton::B] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_X, 0.5f, true};
    m_bindings[PadButton::Start] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_RETURN, 0.5f, true};
    m_bindings[PadButton::Select] = {InputSourceType::Keyboard, -1, SDL_SCANCODE_RSHIFT, 0.5f, true};
}

void InputManager::process_event(const SDL_Event& event) {
    switch (event.type) {
        case SDL_CONTROLLERDEVICEADDED:
            open_controller(event.cdevice.which);
            break;

        case SDL_CONTROLLERDEVICEREMOVED:
            close_controller(event.cdevice.which);
            break;
    }
}

void InputManager::update() {
    update_button_state();
}

bool InputManager::is_binding_pressed(const InputBinding& binding) const {
    switch (binding.type) {
        case InputSourceType::Keyboard:
            return binding.code >= 0 && binding.code < m_keyboard_state_count &&
                   m_keyboard_state[binding.code] != 0;

        case InputSourceType::GamepadButton:
            for (const auto& controller : m_controllers) {
                if (binding.device_id != -1 && binding.device_id != controller.instance_id) continue;
                if (SDL_GameControllerGetButton(controller.controller,
                        static_cast<SDL_GameControllerButton>(binding.code))) {
                    return true;
                }
            }
            return false;

        case InputSourceType::GamepadAxis:
            for (const auto& controller : m_controllers) {
                if (binding.device_id != -1 && binding.device_id != controller.instance_id) continue;
                int16_t value = SDL_GameControllerGetAxis(controller.controller,
                        static_cast<SDL_GameControllerAxis>(binding.code));
                float normalized = value / 32767.0f;
                if (binding.axis_positive ? normalized > binding.axis_threshold
                                          : normalized < -binding.axis_threshold) {
                    return true;
                }
            }
            return false;
    }
    return false;
}

void InputManager::update_button_state() {
    m_button_state = 0;

    for (const auto& [button, binding] : m_bindings) {
        if (is_binding_pressed(binding)) {
            m_button_state |= button_to_mask(button);
        }
    }

    // Gamepad face buttons and D-pad always work
    for (const auto& controller : m_controllers) {
        SDL_GameController* pad = controller.controller;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_DPAD_UP))
            m_button_state |= BUTTON_UP;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_DPAD_DOWN))
            m_button_state |= BUTTON_DOWN;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_DPAD_LEFT))
            m_button_state |= BUTTON_LEFT;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_DPAD_RIGHT))
            m_button_state |= BUTTON_RIGHT;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_A))
            m_button_state |= BUTTON_A;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_B))
            m_button_state |= BUTTON_B;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_START))
            m_button_state |= BUTTON_START;
        if (SDL_GameControllerGetButton(pad, SDL_CONTROLLER_BUTTON_BACK))
            m_button_state |= BUTTON_SELECT;
    }
}

bool InputManager::is_button_pressed(PadButton button) const {
    return (m_button_state & button_to_mask(button)) != 0;
}

void InputManager::open_controller(int device_index) {
    SDL_GameController* controller = SDL_GameControllerOpen(device_index);
    if (!controller) {
        std::cerr << "Failed to open controller " << device_index << ": " << SDL_GetError() << std::endl;
        return;
    }

    int instance_id = SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(controller));
    for (const auto& existing : m_controllers) {
        if (existing.instance_id == instance_id) {
            SDL_GameControllerClose(controller);
            return;
        }
    }

    const char* name_ptr = SDL_GameControllerName(controller);
    ControllerInfo info;
    info.controller = controller;
    info.instance_id = instance_id;
    info.name = name_ptr ? name_ptr : "Unknown Controller";
    m_controllers.push_back(info);

    std::cout << "Controller connected: " << info.name << std::endl;
}

void InputManager::close_controller(int instance_id) {
    for (auto it = m_controllers.begin(); it != m_controllers.end(); ++it) {
        if (it->instance_id == instance_id) {
            std::cout << "Controller disconnected: " << it->name << std::endl;
            SDL_GameControllerClose(it->controller);
            m_controllers.erase(it);
            break;
        }
    }
}

void InputManager::set_binding(PadButton button, const InputBinding& binding) {
    m_bindings[button] = binding;
}

const InputBinding* InputManager::get_binding(PadButton button) const {
    auto it = m_bindings.find(button);
    if (it != m_bindings.end()) {
        return &it->second;
    }
    return nullptr;
}

bool InputManager::save_config() const {
    try {
        std::filesystem::path path(m_config_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        nlohmann::json bindings_json;
        for (const auto& [button, binding] : m_bindings) {
            nlohmann::json binding_json;
            switch (binding.type) {
                case InputSourceType::Keyboard:
                    binding_json["type"] = "Keyboard";
                    break;
                case InputSourceType::GamepadButton:
                    binding_json["type"] = "GamepadButton";
                    break;
                case InputSourceType::GamepadAxis:
                    binding_json["type"] = "GamepadAxis";
                    break;
            }
            binding_json["device_id"] = binding.device_id;
            binding_json["code"] = binding.code;
            binding_json["axis_threshold"] = binding.axis_threshold;
            binding_json["axis_positive"] = binding.axis_positive;
            bindings_json[get_button_name(button)] = binding_json;
        }

        nlohmann::json j;
        j["bindings"] = bindings_json;

        std::ofstream file(m_config_path);
        if (!file) {
            std::cerr << "Failed to open config file for writing: " << m_config_path << std::endl;
            return false;
        }

        file << j.dump(2);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error saving input config: " << e.what() << std::endl;
        return false;
    }
}

bool InputManager::load_config() {
    std::ifstream file(m_config_path);
    if (!file) {
        return false;  // No config file exists, keep defaults
    }

    try {
        nlohmann::json j;
        file >> j;

        if (!j.contains("bindings")) {
            return false;
        }

        for (auto& [button_name, binding_json] : j["bindings"].items()) {
            PadButton button = PadButton::COUNT;
            for (uint32_t i = 0; i < static_cast<uint32_t>(PadButton::COUNT); i++) {
                if (get_button_name(static_cast<PadButton>(i)) == button_name) {
                    button = static_cast<PadButton>(i);
                    break;
                }
            }
            if (button == PadButton::COUNT) {
                std::cerr << "Ignoring binding for unknown button: " << button_name << std::endl;
                continue;
            }

            InputBinding binding;
            std::string type_str = binding_json.value("type", "Keyboard");
            if (type_str == "GamepadButton") {
                binding.type = InputSourceType::GamepadButton;
            } else if (type_str == "GamepadAxis") {
                binding.type = InputSourceType::GamepadAxis;
            }
            binding.device_id = binding_json.value("device_id", -1);
            binding.code = binding_json.value("code", 0);
            binding.axis_threshold = binding_json.value("axis_threshold", 0.5f);
            binding.axis_positive = binding_json.value("axis_positive", true);

            m_bindings[button] = binding;
        }

        std::cout << "Loaded input config: " << m_config_path << std::endl;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error loading input config: " << e.what() << std::endl;
        return false;
    }
}

std::string InputManager::get_button_name(PadButton button) {
    switch (button) {
        case PadButton::A: return "A";
        case PadButton::B: return "B";
        case PadButton::Select: return "Select";
        case PadButton::Start: return "Start";
        case PadButton::Up: return "Up";
        case PadButton::Down: return "Down";
        case PadButton::Left: return "Left";
        case PadButton::Right: return "Right";
        default: return "Unknown";
    }
}

} // namespace famicore::app
