/**
 * Error handling walkthrough using faultline
 *
 * This example demonstrates:
 * - Domain operations and their named failures
 * - Matching on the error category to recover specific detail
 * - The read -> parse -> sqrt -> divide pipeline, success and failure
 * - Config loading with skipped lines, defaulted fields and a hard-failing port
 */

#include <faultline/config.hpp>
#include <faultline/error.hpp>
#include <faultline/io/storage.hpp>
#include <faultline/math/domain_ops.hpp>
#include <faultline/pipeline/scaled_root.hpp>

#include <iostream>
#include <string_view>
#include <variant>

namespace {

void show(std::string_view label, const std::expected<double, faultline::math::domain_error>& r) {
    if (r) std::cout << label << " = " << *r << "\n";
    else std::cout << label << ": " << faultline::math::to_string(r.error()) << "\n";
}

void explain(const faultline::core::error& e) {
    using namespace faultline::core;
    std::cout << "  " << describe(e) << " [code " << static_cast<unsigned>(code_of(e)) << "]\n";
    if (const auto* io = std::get_if<io_failure>(&e.kind)) {
        if (is_not_found(e)) std::cout << "  file is missing: " << io->path << "\n";
    } else if (const auto* p = std::get_if<parse_failure>(&e.kind)) {
        std::cout << "  malformed value: \"" << p->input << "\"\n";
    }
}

void show_config(std::string_view label, const std::expected<faultline::config, faultline::core::error>& c) {
    std::cout << label << ":\n";
    if (!c) { explain(c.error()); return; }
    std::cout << "  debug=" << (c->debug ? "true" : "false") << " port=" << c->port
              << " host=" << c->host << "\n";
}

} // namespace

int main() {
    using namespace faultline;

    show("10 / 2", math::divide(10.0, 2.0));
    show("10 / 0", math::divide(10.0, 0.0));
    show("sqrt(16)", math::sqrt(16.0));
    show("sqrt(-4)", math::sqrt(-4.0));
    show("1e308 * 10", math::multiply(1e308, 10.0));

    io::memory_storage store;
    (void)store.write_text("number.txt", "100");
    (void)store.write_text("negative.txt", "-4");

    for (const char* path : {"number.txt", "negative.txt", "missing.txt"}) {
        auto r = pipeline::compute_scaled_root(store, path);
        std::cout << "scaled root of " << path << ":\n";
        if (r) std::cout << "  " << *r << "\n";
        else explain(r.error());
    }

    (void)store.write_text("good.cfg", "debug=true\nport=3000\nhost=0.0.0.0");
    (void)store.write_text("garbage.cfg", "debug=true\ngarbage-line\nport=3000");
    (void)store.write_text("soft.cfg", "debug=notabool\nport=3000");
    (void)store.write_text("hard.cfg", "port=notanumber");

    show_config("good.cfg", load_config(store, "good.cfg"));
    show_config("garbage.cfg", load_config(store, "garbage.cfg"));
    show_config("soft.cfg", load_config(store, "soft.cfg"));
    show_config("hard.cfg", load_config(store, "hard.cfg"));
    show_config("missing.cfg", load_config(store, "missing.cfg"));

    const auto fallback = load_config_or_default(store, "missing.cfg");
    std::cout << "missing.cfg with fallback: port=" << fallback.port << " host=" << fallback.host << "\n";
    return 0;
}
