//
// Human-readable dump of a command tree, for debugging.
//

#pragma once

#include <ostream>
#include <string>

#include "command.hh"

namespace promptgen {
    void dump_command(std::ostream& out, const command& cmd);
    std::string dump_command(const command& cmd);
}
