#include "faultline/config.hpp"
#include "faultline/core/lexical.hpp"
#include "faultline/core/platform_utils.hpp"
#include "faultline/error.hpp"
#include "faultline/io/storage.hpp"
#include "faultline/pipeline/scaled_root.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {
struct Args {
    std::string command;
    std::optional<std::string> path;
    double divisor{faultline::pipeline::kDefaultDivisor};
    bool fallback{false};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "faultline CLI\n"
              << "Usage: faultline_cli <command> [options]\n"
              << "  root   --path=<file> [--divisor=10]   sqrt(number in file) / divisor\n"
              << "  config [--path=<file>] [--fallback]   load key=value config\n"
              << "  demo                                 write sample files, run both, clean up\n"
              << "config path defaults to $FAULTLINE_CONFIG_PATH, then config.txt\n";
}

static void print_config(const faultline::config& c) {
    std::cout << "config: debug=" << (c.debug ? "true" : "false")
              << " port=" << c.port << " host=" << c.host << "\n";
}

static int run_root(const faultline::io::storage& store, const fs::path& path, double divisor) {
    auto r = faultline::pipeline::compute_scaled_root(store, path, divisor);
    if (!r) {
        std::cerr << "error: " << faultline::core::describe(r.error()) << "\n";
        return 1;
    }
    std::cout << "result: " << *r << "\n";
    return 0;
}

static int run_config(const faultline::io::storage& store, const fs::path& path, bool fallback) {
    if (fallback) {
        print_config(faultline::load_config_or_default(store, path));
        return 0;
    }
    auto c = faultline::load_config(store, path);
    if (!c) {
        std::cerr << "error: " << faultline::core::describe(c.error()) << "\n";
        return 1;
    }
    print_config(*c);
    return 0;
}

static int run_demo(faultline::io::storage& store) {
    const fs::path dir = fs::temp_directory_path();
    const fs::path number = dir / "faultline_demo_number.txt";
    const fs::path cfg = dir / "faultline_demo_config.txt";

    int rc = 0;
    if (auto w = store.write_text(number, "100"); !w) {
        std::cerr << "error: cannot write " << number.string() << ": " << w.error().message() << "\n";
        return 1;
    }
    rc |= run_root(store, number, faultline::pipeline::kDefaultDivisor);

    if (auto w = store.write_text(cfg, "debug=true\nport=3000\nhost=0.0.0.0"); !w) {
        std::cerr << "error: cannot write " << cfg.string() << ": " << w.error().message() << "\n";
        (void)store.remove(number);
        return 1;
    }
    rc |= run_config(store, cfg, true);

    // Cleanup failures do not change the outcome.
    (void)store.remove(number);
    (void)store.remove(cfg);
    return rc;
}
} // namespace

int main(int argc, char** argv) {
    if (argc < 2) { print_usage(); return 2; }
    Args args;
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") { print_usage(); return 0; }
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--path=")) args.path = *v;
        else if (auto v = eat(a, "--divisor=")) {
            auto d = faultline::core::parse_f64(*v);
            if (!d) {
                std::cerr << "invalid --divisor: " << faultline::core::to_string(d.error().kind) << "\n";
                return 2;
            }
            args.divisor = *d;
        }
        else if (a == "--fallback") args.fallback = true;
        else { std::cerr << "unknown argument: " << a << "\n"; print_usage(); return 2; }
    }

    faultline::io::file_storage store;
    if (args.command == "root") {
        if (!args.path) { std::cerr << "root requires --path\n"; return 2; }
        return run_root(store, *args.path, args.divisor);
    }
    if (args.command == "config") {
        fs::path p = args.path ? fs::path(*args.path)
                               : fs::path(faultline::core::safe_getenv("FAULTLINE_CONFIG_PATH").value_or("config.txt"));
        return run_config(store, p, args.fallback);
    }
    if (args.command == "demo") {
        return run_demo(store);
    }
    std::cerr << "unknown command: " << args.command << "\n";
    print_usage();
    return 2;
}
