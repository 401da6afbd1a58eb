#include "app_context.h"
#include "debug_utils.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>
#include <thread>

using namespace std;

static void usage(const char* prog) {
    cerr << "Usage:\n"
         << "  " << prog << " --list\n"
         << "  " << prog << " --totp\n"
         << "  " << prog << " --id\n"
         << "  " << prog << " --status\n"
         << "  " << prog << " --download=<remote path>\n"
         << "  " << prog << " --upload=<local path> [--target=<remote dir>]\n"
         << "\n"
         << "Options:\n"
         << "  --config=<ini>   settings file (default ./cpenlink.ini)\n"
         << "  --quiet          no diagnostics on stderr\n"
         << "\n"
         << "CAMFC_BASE and CAMFC_PORT override the storage endpoint.\n";
}

static int report(const CommandResult& r) {
    if (r.ok) {
        cout << r.message << "\n";
        return 0;
    }
    cerr << "error: " << r.message << "\n";
    return 1;
}

// Prints one line per change until the transfer stops
static int follow_transfer(AppContext& ctx, const string& id, bool upload) {
    string last_line;
    while (true) {
        CommandResult r = upload ? ctx.poll_upload_progress(id)
                                 : ctx.poll_download_progress(id);
        if (!r.ok) {
            return report(r);
        }
        auto j = nlohmann::json::parse(r.message);
        string state = j.value("state", "");

        char line[256];
        snprintf(line, sizeof(line), "%s %s %llu/%llu bytes (%.1f%%)",
                 id.c_str(), state.c_str(),
                 (unsigned long long)j.value("transferred", 0ull),
                 (unsigned long long)j.value("total_size", 0ull),
                 j.value("percent", 0.0));
        if (line != last_line) {
            cout << line << "\n";
            last_line = line;
        }

        if (state == "completed") {
            if (j.contains("local_path")) cout << "saved: " << j["local_path"].get<string>() << "\n";
            if (j.contains("sha256"))     cout << "sha256: " << j["sha256"].get<string>() << "\n";
            return 0;
        }
        if (state == "error") {
            cerr << "error: " << j.value("error", string("transfer failed")) << "\n";
            return 1;
        }
        if (state == "paused") {
            return 1;
        }
        this_thread::sleep_for(chrono::milliseconds(500));
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    string ini_path = "cpenlink.ini";
    string action;
    string download_path;
    string upload_path;
    optional<string> target;

    for (int i = 1; i < argc; ++i) {
        string a  = argv[i];
        auto eq   = a.find('=');
        string key = (eq == string::npos) ? a : a.substr(0, eq);
        string val = (eq == string::npos) ? "" : a.substr(eq + 1);

        if (key == "--config") {
            ini_path = val;
        } else if (key == "--quiet") {
            set_log_enabled(false);
        } else if (key == "--list" || key == "--totp" || key == "--id" || key == "--status") {
            action = key;
        } else if (key == "--download") {
            action = key;
            download_path = val;
        } else if (key == "--upload") {
            action = key;
            upload_path = val;
        } else if (key == "--target") {
            target = val;
        } else {
            cerr << "Unknown option " << a << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    if (action.empty()) {
        usage(argv[0]);
        return 1;
    }

    unique_ptr<AppContext> ctx;
    try {
        ctx.reset(new AppContext(ini_path));
    } catch (const std::exception& e) {
        cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (action == "--list") {
        return report(ctx->list_devices());
    }
    if (action == "--totp") {
        return report(ctx->get_code());
    }
    if (action == "--id") {
        return report(ctx->get_device_id());
    }
    if (action == "--status") {
        return report(ctx->get_connection_status());
    }
    if (action == "--download") {
        CommandResult r = ctx->start_download(download_path);
        if (!r.ok) {
            return report(r);
        }
        return follow_transfer(*ctx, r.message, false);
    }
    if (action == "--upload") {
        if (upload_path.empty()) {
            usage(argv[0]);
            return 1;
        }
        CommandResult r = ctx->start_upload(upload_path, target);
        if (!r.ok) {
            return report(r);
        }
        return follow_transfer(*ctx, r.message, true);
    }

    usage(argv[0]);
    return 1;
}
