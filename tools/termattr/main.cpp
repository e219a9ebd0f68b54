/**
 * @file main.cpp
 * @brief termattr: print or change terminal attributes, stty(1) style.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/attribute_set.h"
#include "termattr/config.h"
#include "termattr/exceptions.h"
#include "termattr/logging.h"
#include "termattr/posix_device.h"
#include "termattr/settings.h"
#include "termattr/snapshot.h"

#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr std::size_t kLineWidth = 80;

int report(const termattr::Error& error) {
    std::cerr << "termattr: " << error.message() << "\n";
    return kExitFailure;
}

/// Print every attribute, wrapped at kLineWidth columns.
/// Booleans print as "name" or "-name", everything else as "name = value;".
void print_attributes(const termattr::AttributeSet& attrs) {
    using namespace termattr;

    auto all = attrs.get_all();
    if (!all) {
        std::cout << attrs.to_string() << "\n";
        return;
    }

    std::string line;
    auto emit = [&line](const std::string& item) {
        if (!line.empty() && line.size() + 1 + item.size() > kLineWidth) {
            std::cout << line << "\n";
            line.clear();
        }
        if (!line.empty()) {
            line += ' ';
        }
        line += item;
    };

    for (const auto& [name, value] : *all) {
        if (const auto* flag = std::get_if<bool>(&value)) {
            emit(*flag ? name : "-" + name);
        } else {
            emit(name + " = " + to_display_string(value) + ";");
        }
    }
    if (!line.empty()) {
        std::cout << line << "\n";
    }
}

int run(const termattr::ToolConfig& config, const char* program) {
    using namespace termattr;

    if (config.usage) {
        std::cout << usage_text(program);
        return kExitOk;
    }
    if (config.help_settings) {
        std::cout << settings_help();
        return kExitOk;
    }

    std::unique_ptr<PosixTerminalDevice> device;
    if (config.device_path.empty()) {
        device = std::make_unique<PosixTerminalDevice>(STDIN_FILENO);
    } else {
        auto opened = PosixTerminalDevice::open(config.device_path);
        if (!opened) {
            return report(opened.error());
        }
        device = std::move(*opened);
    }

    auto attrs = AttributeSet::from_device(*device);
    if (!attrs) {
        return report(attrs.error());
    }

    bool changed = false;

    if (!config.load_path.empty()) {
        auto snapshot = load_snapshot_file(config.load_path);
        if (!snapshot) {
            return report(snapshot.error());
        }
        if (auto restored = attrs->restore(*snapshot); !restored) {
            return report(restored.error());
        }
        changed = true;
    }

    for (const auto& token : config.settings) {
        if (auto applied = apply_setting_token(*attrs, token); !applied) {
            return report(applied.error());
        }
        changed = true;
    }

    if (changed) {
        if (auto applied = attrs->apply_to(*device, config.apply_options()); !applied) {
            return report(applied.error());
        }
    }

    if (!config.save_path.empty()) {
        auto snapshot = attrs->snapshot();
        if (!snapshot) {
            return report(snapshot.error());
        }
        if (auto saved = save_snapshot_file(*snapshot, config.save_path); !saved) {
            return report(saved.error());
        }
    }

    if (config.output == OutputMode::All) {
        print_attributes(*attrs);
    }
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "termattr";

    auto config = termattr::parse_command_line(argc, argv);
    if (!config) {
        std::cerr << "termattr: " << config.error().message() << "\n"
                  << termattr::usage_text(program);
        return kExitUsage;
    }

    termattr::set_log_level(config->log_level);

    try {
        return run(*config, program);
    } catch (const termattr::TermAttrException& e) {
        std::cerr << "termattr: " << e.what() << "\n";
        return kExitFailure;
    }
}
