// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "interactive_shell.h"
#include "esp_log.h"
#include "esp_attr.h"
#include "esp_console.h"
#include "esp_heap_caps.h"
#include "esp_vfs_dev.h"
#include "driver/uart.h"
#include "linenoise/linenoise.h"
#include "argtable3/argtable3.h"
#include <cstdio>
#include <cstring>
#include <unistd.h>

static const char* TAG = "Shell";

InteractiveShell* InteractiveShell::instance_ = nullptr;

namespace {

struct {
    struct arg_str* text;
    struct arg_end* end;
} send_args;

struct {
    struct arg_str* bytes;
    struct arg_end* end;
} hex_args;

struct {
    struct arg_str* name;
    struct arg_end* end;
} macro_args;

struct {
    struct arg_str* name;
    struct arg_str* bytes;
    struct arg_end* end;
} define_args;

struct {
    struct arg_str* path;
    struct arg_str* fit;
    struct arg_str* mode;
    struct arg_end* end;
} upload_args;

struct {
    struct arg_str* key;
    struct arg_str* value;
    struct arg_end* end;
} config_args;

std::string join_args(struct arg_str* arg) {
    std::string text;
    for (int i = 0; i < arg->count; i++) {
        if (i > 0) {
            text += ' ';
        }
        text += arg->sval[i];
    }
    return text;
}

bool is_printable(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        uint8_t c = data[i];
        if ((c < 0x20 || c > 0x7E) && c != '\r' && c != '\n' && c != '\t') {
            return false;
        }
    }
    return len > 0;
}

} // namespace

InteractiveShell::InteractiveShell(BLECentral& central, SketchSettings& settings, SettingsStore& store)
    : central_(central), settings_(settings), store_(store),
      transfer_(central), protocol_(central, mailbox_, transfer_),
      notify_queue_(nullptr), notify_task_(nullptr), cancel_(false), running_(false), initialized_(false) {
    instance_ = this;
}

InteractiveShell::~InteractiveShell() {
    central_.set_notification_callback(nullptr, nullptr);
    if (initialized_) {
        gpio_isr_handler_remove(CANCEL_BUTTON_GPIO);
    }
    if (notify_task_) {
        vTaskDelete(notify_task_);
        notify_task_ = nullptr;
    }
    if (notify_queue_) {
        vQueueDelete(notify_queue_);
        notify_queue_ = nullptr;
    }
    instance_ = nullptr;
}

esp_err_t InteractiveShell::init() {
    if (initialized_) {
        return ESP_OK;
    }

    notify_queue_ = xQueueCreate(NOTIFY_QUEUE_LENGTH, sizeof(Notification));
    if (!notify_queue_) {
        ESP_LOGE(TAG, "Failed to create notification queue");
        return ESP_ERR_NO_MEM;
    }
    if (xTaskCreate(notification_task, "notify_pump", NOTIFY_TASK_STACK, this,
                    NOTIFY_TASK_PRIORITY, &notify_task_) != pdPASS) {
        ESP_LOGE(TAG, "Failed to create notification task");
        return ESP_ERR_NO_MEM;
    }
    central_.set_notification_callback(on_notification, this);
    apply_link_settings();

    esp_err_t ret = init_console();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Console init failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = init_cancel_button();
    if (ret != ESP_OK) {
        // Uploads still work, they just cannot be interrupted
        ESP_LOGW(TAG, "Cancel button unavailable: %s", esp_err_to_name(ret));
    }

    register_commands();
    initialized_ = true;
    return ESP_OK;
}

int InteractiveShell::run() {
    if (!initialized_) {
        ESP_LOGE(TAG, "Shell not initialized");
        return EXIT_CONFIG_INVALID;
    }

    ConnectionGuard guard(central_);

    printf("\nSketchLink shell. Type 'help' for commands, 'quit' to leave.\n");
    printf("Press BOOT to cancel a running upload.\n\n");

    if (linenoiseProbe() != 0) {
        printf("Terminal does not support escape sequences, line editing disabled.\n");
        linenoiseSetDumbMode(1);
    }

    int last_code = EXIT_OK;
    running_ = true;
    while (running_) {
        char* line = linenoise(PROMPT);
        if (line == nullptr) {
            // Ctrl+C or end of input
            printf("\n");
            break;
        }
        if (line[0] != '\0') {
            linenoiseHistoryAdd(line);

            int code = EXIT_OK;
            esp_err_t err = esp_console_run(line, &code);
            if (err == ESP_ERR_NOT_FOUND) {
                printf("Unrecognized command\n");
            } else if (err == ESP_OK) {
                last_code = code;
                if (code != EXIT_OK) {
                    printf("(exit code %d)\n", code);
                }
            } else if (err != ESP_ERR_INVALID_ARG) {
                printf("Internal error: %s\n", esp_err_to_name(err));
            }
        }
        linenoiseFree(line);
    }
    running_ = false;

    printf("Leaving shell\n");
    return last_code;
}

int InteractiveShell::upload(const std::string& path, FitPolicy fit, PixelMode mode) {
    if (transfer_.in_progress()) {
        return report(ErrorKind::BUSY);
    }

    RgbImage image;
    ErrorKind kind = loader_.load(path, PROJECTOR_WIDTH, PROJECTOR_HEIGHT, image);
    if (kind != ErrorKind::NONE) {
        return report(kind);
    }

    EncoderOptions options;
    options.fit = fit;
    EncodedImage encoded;
    kind = encode_image(image, PROJECTOR_WIDTH, PROJECTOR_HEIGHT, mode, options, encoded);
    image = RgbImage();
    if (kind != ErrorKind::NONE) {
        return report(kind);
    }
    if (mode != PROJECTOR_PIXEL_MODE) {
        ESP_LOGW(TAG, "Projector expects %s, sending %s", pixel_mode_name(PROJECTOR_PIXEL_MODE),
                 pixel_mode_name(mode));
    }

    std::vector<uint8_t> payload = device_payload(encoded, settings_.reverse_payload);
    encoded = EncodedImage();

    kind = ensure_connected();
    if (kind != ErrorKind::NONE) {
        return report(kind);
    }

    printf("Uploading %s: %dx%d %s, %s, %d bytes\n", path.c_str(), PROJECTOR_WIDTH, PROJECTOR_HEIGHT,
           pixel_mode_name(mode), fit_policy_name(fit), (int)payload.size());

    uint32_t last_decile = 0;
    TransferProgressCallback progress = [&last_decile](uint32_t sent, uint32_t total) {
        uint32_t decile = sent * 10 / total;
        if (decile != last_decile || sent == total) {
            last_decile = decile;
            printf("  Progress: %lu/%lu (%lu%%)\n", (unsigned long)sent, (unsigned long)total,
                   (unsigned long)(sent * 100 / total));
        }
    };

    cancel_ = false;
    SketcherProtocol::UploadResult result = protocol_.upload(payload, settings_, &cancel_, progress);
    payload.clear();
    payload.shrink_to_fit();

    ErrorKind error = result.error();
    if (error == ErrorKind::NONE) {
        if (result.done_received) {
            printf("Image uploaded, projector reported Done\n");
        } else {
            printf("Upload completed but no 'Done' received, check the projector\n");
        }
    } else if (error == ErrorKind::CANCELLED) {
        printf("Upload cancelled after %lu of %lu frames (last sent frame %lld)\n",
               (unsigned long)result.transfer.frames_sent, (unsigned long)result.transfer.total_frames,
               (long long)result.transfer.last_sent_frame());
        central_.disconnect();
    } else if (result.transfer.status == TransferStatus::FAILED) {
        printf("Upload failed at frame %lu (%s)\n", (unsigned long)result.transfer.last_error.frame_index,
               link_status_name(result.transfer.last_error.link_status));
    }

    log_heap_usage();
    return report(error);
}

int InteractiveShell::send_bytes(const std::vector<uint8_t>& bytes) {
    ErrorKind kind = ensure_connected();
    if (kind != ErrorKind::NONE) {
        return report(kind);
    }

    TransferResult result = protocol_.send_command(bytes, settings_);
    if (!result.ok()) {
        return report(transfer_failure_kind(result));
    }
    printf("Sent %d bytes: %s\n", (int)bytes.size(), format_hex(bytes.data(), bytes.size()).c_str());
    return EXIT_OK;
}

esp_err_t InteractiveShell::init_console() {
    fflush(stdout);
    fsync(fileno(stdout));
    setvbuf(stdin, nullptr, _IONBF, 0);

    esp_vfs_dev_uart_port_set_rx_line_endings(CONFIG_ESP_CONSOLE_UART_NUM, ESP_LINE_ENDINGS_CR);
    esp_vfs_dev_uart_port_set_tx_line_endings(CONFIG_ESP_CONSOLE_UART_NUM, ESP_LINE_ENDINGS_CRLF);

    const uart_config_t uart_config = {
        .baud_rate = CONFIG_ESP_CONSOLE_UART_BAUDRATE,
        .data_bits = UART_DATA_8_BITS,
        .parity = UART_PARITY_DISABLE,
        .stop_bits = UART_STOP_BITS_1,
        .flow_ctrl = UART_HW_FLOWCTRL_DISABLE,
        .rx_flow_ctrl_thresh = 0,
        .source_clk = UART_SCLK_DEFAULT,
    };
    esp_err_t ret = uart_driver_install(CONFIG_ESP_CONSOLE_UART_NUM, 256, 0, 0, nullptr, 0);
    if (ret != ESP_OK) {
        return ret;
    }
    ret = uart_param_config(CONFIG_ESP_CONSOLE_UART_NUM, &uart_config);
    if (ret != ESP_OK) {
        return ret;
    }
    esp_vfs_dev_uart_use_driver(CONFIG_ESP_CONSOLE_UART_NUM);

    esp_console_config_t console_config = ESP_CONSOLE_CONFIG_DEFAULT();
    console_config.max_cmdline_length = 256;
    console_config.max_cmdline_args = 32;
    ret = esp_console_init(&console_config);
    if (ret != ESP_OK) {
        return ret;
    }

    linenoiseSetMultiLine(1);
    linenoiseSetCompletionCallback(&esp_console_get_completion);
    linenoiseSetHintsCallback(reinterpret_cast<linenoiseHintsCallback*>(&esp_console_get_hint));
    linenoiseHistorySetMaxLen(50);
    return ESP_OK;
}

esp_err_t InteractiveShell::init_cancel_button() {
    gpio_config_t io_conf = {
        .pin_bit_mask = 1ULL << CANCEL_BUTTON_GPIO,
        .mode = GPIO_MODE_INPUT,
        .pull_up_en = GPIO_PULLUP_ENABLE,
        .pull_down_en = GPIO_PULLDOWN_DISABLE,
        .intr_type = GPIO_INTR_NEGEDGE,
    };
    esp_err_t ret = gpio_config(&io_conf);
    if (ret != ESP_OK) {
        return ret;
    }

    ret = gpio_install_isr_service(0);
    // Already installed by another component
    if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
        return ret;
    }
    return gpio_isr_handler_add(CANCEL_BUTTON_GPIO, cancel_isr, this);
}

void InteractiveShell::register_commands() {
    esp_console_register_help_command();

    send_args.text = arg_strn(nullptr, nullptr, "<text>", 1, 16, "Text to send, escapes \\n \\r \\t \\0 \\\\ \\xHH");
    send_args.end = arg_end(2);
    const esp_console_cmd_t send_cmd = {
        .command = "send",
        .help = "Send literal bytes (words are joined with single spaces)",
        .hint = nullptr,
        .func = &cmd_send,
        .argtable = &send_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&send_cmd));

    hex_args.bytes = arg_strn(nullptr, nullptr, "<bytes>", 1, 32, "Hex bytes, e.g. 01 00 ff or 0x01,0x02");
    hex_args.end = arg_end(2);
    const esp_console_cmd_t hex_cmd = {
        .command = "hex",
        .help = "Send hex-encoded bytes",
        .hint = nullptr,
        .func = &cmd_hex,
        .argtable = &hex_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&hex_cmd));

    macro_args.name = arg_str0(nullptr, nullptr, "<name>", "Macro to send; omit to list");
    macro_args.end = arg_end(2);
    const esp_console_cmd_t macro_cmd = {
        .command = "macro",
        .help = "Send a named command or list the macro table",
        .hint = nullptr,
        .func = &cmd_macro,
        .argtable = &macro_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&macro_cmd));

    define_args.name = arg_str1(nullptr, nullptr, "<name>", "Macro name [a-z0-9_]");
    define_args.bytes = arg_strn(nullptr, nullptr, "<bytes>", 1, 32, "Hex bytes");
    define_args.end = arg_end(2);
    const esp_console_cmd_t define_cmd = {
        .command = "define",
        .help = "Define a session macro",
        .hint = nullptr,
        .func = &cmd_define,
        .argtable = &define_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&define_cmd));

    upload_args.path = arg_str1(nullptr, nullptr, "<path>", "Image file (JPEG, PPM, PGM), relative to /spiffs");
    upload_args.fit = arg_str0("f", "fit", "<letterbox|crop|stretch>", "Aspect ratio handling");
    upload_args.mode = arg_str0("m", "mode", "<rgb565|gray8|mono1>", "Pixel encoding");
    upload_args.end = arg_end(3);
    const esp_console_cmd_t upload_cmd = {
        .command = "upload",
        .help = "Convert an image and upload it to the projector",
        .hint = nullptr,
        .func = &cmd_upload,
        .argtable = &upload_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&upload_cmd));

    const esp_console_cmd_t connect_cmd = {
        .command = "connect",
        .help = "Scan for the projector and connect",
        .hint = nullptr,
        .func = &cmd_connect,
        .argtable = nullptr,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&connect_cmd));

    const esp_console_cmd_t disconnect_cmd = {
        .command = "disconnect",
        .help = "Close the connection",
        .hint = nullptr,
        .func = &cmd_disconnect,
        .argtable = nullptr,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&disconnect_cmd));

    const esp_console_cmd_t status_cmd = {
        .command = "status",
        .help = "Show connection and memory status",
        .hint = nullptr,
        .func = &cmd_status,
        .argtable = nullptr,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&status_cmd));

    config_args.key = arg_str0(nullptr, nullptr, "<key|save|reset>", "Setting to show or change");
    config_args.value = arg_str0(nullptr, nullptr, "<value>", "New value");
    config_args.end = arg_end(2);
    const esp_console_cmd_t config_cmd = {
        .command = "config",
        .help = "Show or change settings; 'config save' stores them in NVS",
        .hint = nullptr,
        .func = &cmd_config,
        .argtable = &config_args,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&config_cmd));

    const esp_console_cmd_t quit_cmd = {
        .command = "quit",
        .help = "Disconnect and leave the shell",
        .hint = nullptr,
        .func = &cmd_quit,
        .argtable = nullptr,
    };
    ESP_ERROR_CHECK(esp_console_cmd_register(&quit_cmd));
}

ErrorKind InteractiveShell::ensure_connected() {
    if (central_.is_connected()) {
        return ErrorKind::NONE;
    }

    apply_link_settings();
    DeviceHandle device;
    esp_err_t ret = central_.scan(settings_.name_filter, settings_.scan_timeout_ms, device);
    if (ret == ESP_ERR_NOT_FOUND) {
        return ErrorKind::NOT_FOUND;
    }
    if (ret != ESP_OK) {
        return ErrorKind::CONNECTION_ERROR;
    }

    ret = central_.connect(device, settings_.connect_timeout_ms);
    if (ret != ESP_OK) {
        return ErrorKind::CONNECTION_ERROR;
    }
    printf("Connected to %s (MTU %d)\n", device.name.c_str(), central_.get_device().mtu);
    return ErrorKind::NONE;
}

void InteractiveShell::apply_link_settings() {
    central_.set_write_timeout(settings_.write_timeout_ms);
    central_.set_write_with_response(settings_.write_with_response);
}

int InteractiveShell::report(ErrorKind kind) {
    if (kind != ErrorKind::NONE) {
        printf("Error: %s\n", error_kind_message(kind));
    }
    return exit_code_for(kind);
}

void InteractiveShell::log_heap_usage() {
    uint32_t free_heap = heap_caps_get_free_size(MALLOC_CAP_DEFAULT);
    uint32_t free_internal = heap_caps_get_free_size(MALLOC_CAP_INTERNAL);
    uint32_t free_spiram = heap_caps_get_free_size(MALLOC_CAP_SPIRAM);
    uint32_t min_free_heap = heap_caps_get_minimum_free_size(MALLOC_CAP_DEFAULT);

    ESP_LOGI(TAG, "📊 MEMORY STATUS:");
    ESP_LOGI(TAG, "  Free heap (total): %lu bytes (%.1f KB)", free_heap, free_heap / 1024.0f);
    ESP_LOGI(TAG, "  Free internal RAM: %lu bytes (%.1f KB)", free_internal, free_internal / 1024.0f);
    ESP_LOGI(TAG, "  Free SPIRAM: %lu bytes (%.1f KB)", free_spiram, free_spiram / 1024.0f);
    ESP_LOGI(TAG, "  Minimum free heap ever: %lu bytes (%.1f KB)", min_free_heap, min_free_heap / 1024.0f);
}

int InteractiveShell::do_send(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&send_args)) != 0) {
        arg_print_errors(stderr, send_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    std::vector<uint8_t> bytes;
    std::string error;
    if (!parse_literal_bytes(join_args(send_args.text), bytes, &error)) {
        printf("Invalid text: %s\n", error.c_str());
        return EXIT_CONFIG_INVALID;
    }
    return send_bytes(bytes);
}

int InteractiveShell::do_hex(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&hex_args)) != 0) {
        arg_print_errors(stderr, hex_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    std::vector<uint8_t> bytes;
    std::string error;
    if (!parse_hex_bytes(join_args(hex_args.bytes), bytes, &error)) {
        printf("Invalid hex: %s\n", error.c_str());
        return EXIT_CONFIG_INVALID;
    }
    return send_bytes(bytes);
}

int InteractiveShell::do_macro(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&macro_args)) != 0) {
        arg_print_errors(stderr, macro_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    if (macro_args.name->count == 0) {
        for (const auto& entry : macros_.entries()) {
            printf("  %-16s %s%s\n", entry.first.c_str(),
                   format_hex(entry.second.data(), entry.second.size()).c_str(),
                   macros_.is_builtin(entry.first) ? "  (built-in)" : "");
        }
        return EXIT_OK;
    }

    std::vector<uint8_t> bytes;
    if (!macros_.lookup(macro_args.name->sval[0], bytes)) {
        printf("Unknown macro '%s'\n", macro_args.name->sval[0]);
        return EXIT_CONFIG_INVALID;
    }
    return send_bytes(bytes);
}

int InteractiveShell::do_define(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&define_args)) != 0) {
        arg_print_errors(stderr, define_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    std::vector<uint8_t> bytes;
    std::string error;
    if (!parse_hex_bytes(join_args(define_args.bytes), bytes, &error)) {
        printf("Invalid hex: %s\n", error.c_str());
        return EXIT_CONFIG_INVALID;
    }

    const char* name = define_args.name->sval[0];
    if (!macros_.define(name, bytes)) {
        printf("Cannot define '%s': names use [a-z0-9_] and built-ins are fixed\n", name);
        return EXIT_CONFIG_INVALID;
    }
    printf("%s = %s\n", name, format_hex(bytes.data(), bytes.size()).c_str());
    return EXIT_OK;
}

int InteractiveShell::do_upload(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&upload_args)) != 0) {
        arg_print_errors(stderr, upload_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    FitPolicy fit = settings_.fit;
    if (upload_args.fit->count > 0 && !parse_fit_policy(upload_args.fit->sval[0], fit)) {
        printf("Unknown fit '%s'\n", upload_args.fit->sval[0]);
        return EXIT_CONFIG_INVALID;
    }
    PixelMode mode = settings_.mode;
    if (upload_args.mode->count > 0 && !parse_pixel_mode(upload_args.mode->sval[0], mode)) {
        printf("Unknown mode '%s'\n", upload_args.mode->sval[0]);
        return EXIT_CONFIG_INVALID;
    }
    return upload(upload_args.path->sval[0], fit, mode);
}

int InteractiveShell::do_connect() {
    if (central_.is_connected()) {
        printf("Already connected to %s\n", central_.get_device().name.c_str());
        return EXIT_OK;
    }
    return report(ensure_connected());
}

int InteractiveShell::do_disconnect() {
    if (!central_.is_connected()) {
        printf("Not connected\n");
        return EXIT_OK;
    }
    esp_err_t ret = central_.disconnect();
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Disconnect reported %s", esp_err_to_name(ret));
    }
    printf("Disconnected\n");
    return EXIT_OK;
}

int InteractiveShell::do_status() {
    if (central_.is_connected()) {
        const DeviceHandle& device = central_.get_device();
        printf("Connected:       %s (" ESP_BD_ADDR_STR ")\n", device.name.c_str(), ESP_BD_ADDR_HEX(device.address));
        printf("MTU:             %d (max write %d)\n", device.mtu, (int)central_.max_write_size());
        printf("Write handle:    %d\n", device.write_char_handle);
        printf("Notify handle:   %d\n", device.notify_char_handle);
    } else {
        printf("Connected:       no\n");
    }
    printf("Transfer:        %s\n", transfer_.in_progress() ? "in progress" : "idle");
    printf("Responses:       %d queued\n", (int)mailbox_.size());
    printf("Free heap:       %lu bytes\n", (unsigned long)heap_caps_get_free_size(MALLOC_CAP_DEFAULT));
    return EXIT_OK;
}

int InteractiveShell::do_config(int argc, char** argv) {
    if (arg_parse(argc, argv, reinterpret_cast<void**>(&config_args)) != 0) {
        arg_print_errors(stderr, config_args.end, argv[0]);
        return EXIT_CONFIG_INVALID;
    }

    std::string value;
    if (config_args.key->count == 0) {
        for (const char* key : setting_keys()) {
            get_setting(settings_, key, value);
            printf("  %-20s %s\n", key, value.c_str());
        }
        return EXIT_OK;
    }

    std::string key = config_args.key->sval[0];
    if (key == "save") {
        if (store_.save(settings_) != ESP_OK) {
            printf("Failed to save settings\n");
            return EXIT_CONFIG_INVALID;
        }
        printf("Settings saved\n");
        return EXIT_OK;
    }
    if (key == "reset") {
        settings_ = SketchSettings();
        apply_link_settings();
        if (store_.erase() != ESP_OK) {
            printf("Defaults restored, but stored settings could not be erased\n");
            return EXIT_CONFIG_INVALID;
        }
        printf("Defaults restored\n");
        return EXIT_OK;
    }

    if (config_args.value->count == 0) {
        if (!get_setting(settings_, key, value)) {
            printf("Unknown setting '%s'\n", key.c_str());
            return EXIT_CONFIG_INVALID;
        }
        printf("%s = %s\n", key.c_str(), value.c_str());
        return EXIT_OK;
    }

    if (!set_setting(settings_, key, config_args.value->sval[0])) {
        printf("Invalid value '%s' for '%s'\n", config_args.value->sval[0], key.c_str());
        return EXIT_CONFIG_INVALID;
    }
    apply_link_settings();
    get_setting(settings_, key, value);
    printf("%s = %s (run 'config save' to keep it)\n", key.c_str(), value.c_str());
    return EXIT_OK;
}

int InteractiveShell::do_quit() {
    running_ = false;
    return EXIT_OK;
}

// Static console wrappers
int InteractiveShell::cmd_send(int argc, char** argv) {
    return instance_ ? instance_->do_send(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_hex(int argc, char** argv) {
    return instance_ ? instance_->do_hex(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_macro(int argc, char** argv) {
    return instance_ ? instance_->do_macro(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_define(int argc, char** argv) {
    return instance_ ? instance_->do_define(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_upload(int argc, char** argv) {
    return instance_ ? instance_->do_upload(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_connect(int argc, char** argv) {
    return instance_ ? instance_->do_connect() : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_disconnect(int argc, char** argv) {
    return instance_ ? instance_->do_disconnect() : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_status(int argc, char** argv) {
    return instance_ ? instance_->do_status() : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_config(int argc, char** argv) {
    return instance_ ? instance_->do_config(argc, argv) : EXIT_CONFIG_INVALID;
}

int InteractiveShell::cmd_quit(int argc, char** argv) {
    return instance_ ? instance_->do_quit() : EXIT_CONFIG_INVALID;
}

void InteractiveShell::on_notification(const uint8_t* data, uint16_t len, void* ctx) {
    InteractiveShell* shell = static_cast<InteractiveShell*>(ctx);
    if (!shell || !shell->notify_queue_ || len == 0) {
        return;
    }

    Notification notification;
    notification.len = len < NOTIFY_MAX_LENGTH ? len : NOTIFY_MAX_LENGTH;
    memcpy(notification.data, data, notification.len);
    if (xQueueSend(shell->notify_queue_, &notification, 0) != pdTRUE) {
        ESP_LOGW(TAG, "Notification queue full, dropping %d bytes", len);
    }
}

void InteractiveShell::notification_task(void* arg) {
    InteractiveShell* shell = static_cast<InteractiveShell*>(arg);
    Notification notification;
    for (;;) {
        if (xQueueReceive(shell->notify_queue_, &notification, portMAX_DELAY) == pdTRUE) {
            shell->print_notification(notification);
        }
    }
}

void IRAM_ATTR InteractiveShell::cancel_isr(void* arg) {
    static_cast<InteractiveShell*>(arg)->cancel_.store(true);
}

void InteractiveShell::print_notification(const Notification& notification) {
    std::string text = notification_text(notification.data, notification.len);
    if (is_printable(notification.data, notification.len)) {
        printf("\r  Device: %s\n", text.c_str());
    } else {
        printf("\r  Device: [%s]\n", format_hex(notification.data, notification.len).c_str());
    }
    fflush(stdout);

    // Handshake replies may carry framing bytes around the text
    mailbox_.post(text);
}
