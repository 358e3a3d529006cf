#pragma once

#include "shell/CommandUsage.hpp"

namespace pawup::shell {

struct PawupUsage {
    static CommandBook all();

    static CommandUsage config();
    static CommandUsage defaultSelector();
    static CommandUsage alias();
    static CommandUsage show();
    static CommandUsage update();
    static CommandUsage install();
    static CommandUsage remove();
    static CommandUsage purge();
    static CommandUsage help();
    static CommandUsage version();
};

}
