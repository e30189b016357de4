// SPDX-License-Identifier: Apache-2.0
// Part of WebApi (WA) project.
// apps/wa_cgi_basic.cpp

#include "wa/app_config.hpp"
#include "wa/application.hpp"
#include "wa/context.hpp"
#include "wa/cookies.hpp"
#include "wa/dispatch.hpp"
#include "wa/environment.hpp"
#include "wa/header.hpp"
#include "wa/http_outcome.hpp"
#include "wa/log.hpp"
#include "wa/internal/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

extern char** environ;

namespace {

// Custom pages for everything mounted under /admin.
class AdminApp : public wa::Application {
public:
    wa::HttpOutcome notfound(wa::Context& ctx) const override {
        return wa::make_outcome(ctx, wa::Status::NotFound, "admin: no such page");
    }
};

const AdminApp kAdmin{};

std::string describe(const wa::Value& v) {
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    if (auto* l = std::get_if<std::vector<std::string>>(&v)) {
        std::string out = "[";
        for (std::size_t i = 0; i < l->size(); ++i) {
            if (i) out += ", ";
            out += (*l)[i];
        }
        return out + "]";
    }
    if (auto* f = std::get_if<wa::FilePtr>(&v)) {
        if (!*f) return "<no file>";
        return "<file " + (*f)->filename() + ", " + std::to_string((*f)->size()) + " bytes>";
    }
    return "<files>";
}

wa::HandlerResult serve_admin(wa::Context& ctx) {
    ctx.mount("/admin", &kAdmin);
    if (ctx.path() == "/" || ctx.path().empty()) {
        std::string body = "admin home at " + ctx.home() + "\n";
        ctx.unmount();
        return body;
    }
    wa::HttpOutcome out = wa::notfound(ctx);
    ctx.unmount();
    return out;
}

wa::HandlerResult serve(wa::Context& ctx) {
    const std::string& path = ctx.path();

    if (path.compare(0, 6, "/admin") == 0) return serve_admin(ctx);

    if (ctx.method() != "GET" && ctx.method() != "HEAD" && ctx.method() != "POST") {
        return wa::nomethod(ctx, {"GET", "HEAD", "POST"});
    }

    if (path == "/" || path.empty()) {
        wa::Validated in = ctx.input();
        if (!in.ok) return *in.outcome;
        std::string body;
        for (const auto& kv : in.data) body += kv.first + " = " + describe(kv.second) + "\n";
        wa::header(ctx, "Content-Type", "text/plain; charset=utf-8");
        return body;
    }

    if (path == "/hello") {
        wa::Validated in = ctx.input({"name"});
        if (!in.ok) return *in.outcome;
        wa::header(ctx, "Content-Type", "text/plain; charset=utf-8");
        return "hello, " + wa::text_or(in.data.get("name")) + "\n";
    }

    if (path == "/counter") {
        wa::Validated c = ctx.cookies({}, wa::Defaults{{"visits", wa::FieldDefault::text("0")}});
        if (!c.ok) return *c.outcome;
        std::size_t visits = 0;
        if (!wa::internal::parse_size(wa::text_or(c.data.get("visits")), visits)) visits = 0;
        ++visits;

        wa::CookieOptions opt;
        opt.expires_in = 3600;
        opt.httponly = true;
        opt.samesite = "lax";
        wa::setcookie(ctx, "visits", std::to_string(visits), opt);
        wa::header(ctx, "Content-Type", "text/plain; charset=utf-8");
        return "visits: " + std::to_string(visits) + "\n";
    }

    if (path == "/upload") {
        if (ctx.method() != "POST") return wa::nomethod(ctx, {"POST"});
        wa::Validated in = ctx.input({"file"}, wa::Defaults{{"file", wa::FieldDefault::file()}});
        if (!in.ok) return *in.outcome;
        return wa::created(ctx, describe(in.data.at("file")) + "\n");
    }

    if (path == "/old") return wa::redirect(ctx, "/hello?name=redirected");
    if (path == "/elsewhere") return wa::seeother(ctx, "/", true);

    return wa::notfound(ctx);
}

void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--debug 0|1] [--redact_errors 0|1] [--log_file <path>]\n"
         "  [--quiet 0|1]                    (no log mirroring to stderr when 1)\n"
         "  Multipart limits:\n"
         "    [--tmp_dir /tmp] [--memfile_limit 262144] [--mem_limit 1048576]\n"
         "    [--disk_limit 1073741824] [--buffer_size 65536] [--max_header_bytes 8192]\n";
}

bool parse_flag_size(const char* s, std::size_t& out) {
    return wa::internal::parse_size(s, out) && out > 0;
}

} // namespace

int main(int argc, char** argv) {
    wa::AppConfig cfg;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool ok = true;
        if (a == "--debug" && i+1 < argc) cfg.debug = std::string(argv[++i]) != "0";
        else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = std::string(argv[++i]) != "0";
        else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
        else if (a == "--quiet" && i+1 < argc) quiet = std::string(argv[++i]) != "0";

        // Multipart limits
        else if (a == "--tmp_dir" && i+1 < argc) cfg.form.tmp_dir = argv[++i];
        else if (a == "--memfile_limit" && i+1 < argc) ok = parse_flag_size(argv[++i], cfg.form.memfile_limit);
        else if (a == "--mem_limit" && i+1 < argc) ok = parse_flag_size(argv[++i], cfg.form.mem_limit);
        else if (a == "--disk_limit" && i+1 < argc) ok = parse_flag_size(argv[++i], cfg.form.disk_limit);
        else if (a == "--buffer_size" && i+1 < argc) ok = parse_flag_size(argv[++i], cfg.form.buffer_size);
        else if (a == "--max_header_bytes" && i+1 < argc) ok = parse_flag_size(argv[++i], cfg.form.max_header_bytes);

        else ok = false;

        if (!ok) { usage(argv[0]); return 2; }
    }

    if (quiet) wa::set_log_console(false);
    if (!cfg.log_file.empty()) wa::set_log_file(cfg.log_file);

    try {
        std::ios::sync_with_stdio(false);
        wa::Environment env = wa::environment_from_cgi(environ, &std::cin);
        if (env.get("REQUEST_METHOD").empty()) {
            throw std::runtime_error("REQUEST_METHOD not set; run under a CGI gateway");
        }
        wa::Response r = wa::handle(env, cfg, serve);
        wa::log_line("[INFO] " + env.get("REQUEST_METHOD") + " " + env.get("PATH_INFO", "/") +
                     " -> " + r.status);
        std::cout << wa::to_cgi(r);
        std::cout.flush();
    } catch (const std::exception& e) {
        wa::log_line(std::string("[FATAL] exception: ") + e.what());
        return 1;
    }
    return 0;
}
