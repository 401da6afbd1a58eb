#pragma once
#include "app_config.h"
#include "http_client.h"
#include "ini_store.h"
#include "pen_device_manager.h"
#include "transfer_registry.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Outcome of one command; 'message' is the value on success and the
// error text on failure.
struct CommandResult {
    bool ok = false;
    std::string message;

    static CommandResult success(std::string msg) { return {true, std::move(msg)}; }
    static CommandResult failure(std::string msg) { return {false, std::move(msg)}; }
};

using HttpTransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

// Composition root: configuration, the pen, the storage endpoint and the
// running transfers. Every command returns a CommandResult and never throws.
class AppContext {
public:
    // Reads 'ini_path' (missing file = defaults) and wires up BlueZ and the
    // Beast HTTP client. Throws std::invalid_argument on a malformed
    // endpoint URL.
    explicit AppContext(const std::string& ini_path);

    // Pre-built parts, no INI persistence
    AppContext(AppConfig config,
               std::unique_ptr<PenDeviceManager> manager,
               HttpTransportFactory http,
               TransferOptions transfer_opts = TransferOptions());

    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    CommandResult get_code();
    CommandResult get_device_id();
    CommandResult get_connection_status();
    CommandResult is_connected();
    CommandResult disconnect();
    CommandResult cleanup();
    CommandResult list_devices();

    CommandResult start_download(const std::string& remote_path);
    CommandResult poll_download_progress(const std::string& id);
    CommandResult pause_download(const std::string& id);

    CommandResult start_upload(const std::string& local_path,
                               const std::optional<std::string>& target_path);
    CommandResult poll_upload_progress(const std::string& id);
    CommandResult pause_upload(const std::string& id);
    CommandResult resume_upload(const std::string& id);

    const AppConfig& config() const { return m_config; }
    TransferRegistry& transfers() { return m_transfers; }

private:
    template <typename Fn>
    CommandResult guarded(const char* what, Fn fn);

    AuthInfo fetch_auth();
    std::shared_ptr<StorageClient> make_client();
    CommandResult progress_of(const std::string& id);
    void remember_peer();

    std::mutex m_ini_mutex;
    std::unique_ptr<IniFile> m_ini;
    AppConfig m_config;
    std::unique_ptr<PenDeviceManager> m_manager;
    HttpTransportFactory m_http;
    TransferOptions m_transfer_opts;
    TransferRegistry m_transfers;
};

// Snapshot as a JSON object (id, name, sizes, percent, state, ...)
std::string progress_json(const TransferProgress& p);
