#pragma once

namespace miniparse {

// miniparse config [--config <path>]
int cmd_config(int argc, char** argv);

} // namespace miniparse
