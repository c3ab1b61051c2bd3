#pragma once

namespace miniparse {

// miniparse parse [--config <path>] [--text <str> | --input <path>] [--out <path>] [--compact]
int cmd_parse(int argc, char** argv);

} // namespace miniparse
