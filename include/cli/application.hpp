#pragma once

namespace huffpack::cli {

int run(int argc, char** argv);

} // namespace huffpack::cli
