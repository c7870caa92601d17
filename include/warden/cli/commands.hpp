#pragma once

namespace warden::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace warden::cli
