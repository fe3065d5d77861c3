#ifndef BASTION_CONFIG_LOADER_H
#define BASTION_CONFIG_LOADER_H

#include "bastion_components.h"
#include <string>

namespace bastion {

// Every key is optional; absent keys keep the compiled default.
// A malformed document is reported and yields the defaults.
// The host reads the file (res:// paths resolve only there).
GameConfig parse_game_config(const std::string &text);

} // namespace bastion

#endif // BASTION_CONFIG_LOADER_H
