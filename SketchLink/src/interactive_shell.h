// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_central.h"
#include "chunked_transfer.h"
#include "command_parser.h"
#include "image_loader.h"
#include "response_mailbox.h"
#include "settings_store.h"
#include "sketch_config.h"
#include "sketch_errors.h"
#include "sketcher_protocol.h"
#include "driver/gpio.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#include <atomic>
#include <string>
#include <vector>

// Disconnects on scope exit unless released.
class ConnectionGuard {
public:
    explicit ConnectionGuard(BLECentral& central) : central_(central), armed_(true) {}
    ~ConnectionGuard() {
        if (armed_) {
            central_.disconnect();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    void release() { armed_ = false; }

private:
    BLECentral& central_;
    bool armed_;
};

/**
 * @brief InteractiveShell - serial console front end
 *
 * Commands (esp_console + argtable3, line editing by linenoise):
 *   send <text...>           literal bytes, escapes \n \r \t \0 \\ \xHH
 *   hex <bytes...>           hex bytes ("01 02", "0x01,0x02", "01:02")
 *   macro [name]             send a named command, or list macros
 *   define <name> <hex...>   add a session macro
 *   upload <path> [-f fit] [-m mode]
 *   connect / disconnect / status
 *   config [key [value]] | config save | config reset
 *   quit                     (Ctrl+C or EOF at the prompt do the same)
 *
 * Every command returns an ExitCode. Commands that need the link connect
 * on demand with the current settings.
 *
 * Notifications are handed from the Bluedroid task to a queue and printed
 * by a separate pump task, so inbound text shows up while a line is being
 * typed. The same task feeds the ResponseMailbox used by the upload
 * handshake.
 *
 * The BOOT button (GPIO0) cancels a running upload after the current
 * frame; the connection is then closed.
 */
class InteractiveShell {
public:
    static constexpr gpio_num_t CANCEL_BUTTON_GPIO = GPIO_NUM_0;
    static constexpr const char* PROMPT = "sketch> ";

    InteractiveShell(BLECentral& central, SketchSettings& settings, SettingsStore& store);
    ~InteractiveShell();

    esp_err_t init();

    // Blocks until quit; always leaves the link disconnected.
    int run();

    // Image upload entry point, also used for the boot image.
    int upload(const std::string& path, FitPolicy fit, PixelMode mode);

    int send_bytes(const std::vector<uint8_t>& bytes);

private:
    static InteractiveShell* instance_;

    static constexpr size_t NOTIFY_QUEUE_LENGTH = 16;
    static constexpr size_t NOTIFY_MAX_LENGTH = 64;
    static constexpr uint32_t NOTIFY_TASK_STACK = 4096;
    static constexpr UBaseType_t NOTIFY_TASK_PRIORITY = 5;

    struct Notification {
        uint16_t len;
        uint8_t data[NOTIFY_MAX_LENGTH];
    };

    BLECentral& central_;
    SketchSettings& settings_;
    SettingsStore& store_;

    ResponseMailbox mailbox_;
    ChunkedTransfer transfer_;
    SketcherProtocol protocol_;
    MacroTable macros_;
    ImageLoader loader_;

    QueueHandle_t notify_queue_;
    TaskHandle_t notify_task_;
    std::atomic<bool> cancel_;
    bool running_;
    bool initialized_;

    esp_err_t init_console();
    esp_err_t init_cancel_button();
    void register_commands();

    ErrorKind ensure_connected();
    void apply_link_settings();
    int report(ErrorKind kind);
    void log_heap_usage();

    // Command handlers
    int do_send(int argc, char** argv);
    int do_hex(int argc, char** argv);
    int do_macro(int argc, char** argv);
    int do_define(int argc, char** argv);
    int do_upload(int argc, char** argv);
    int do_connect();
    int do_disconnect();
    int do_status();
    int do_config(int argc, char** argv);
    int do_quit();

    // esp_console entry points
    static int cmd_send(int argc, char** argv);
    static int cmd_hex(int argc, char** argv);
    static int cmd_macro(int argc, char** argv);
    static int cmd_define(int argc, char** argv);
    static int cmd_upload(int argc, char** argv);
    static int cmd_connect(int argc, char** argv);
    static int cmd_disconnect(int argc, char** argv);
    static int cmd_status(int argc, char** argv);
    static int cmd_config(int argc, char** argv);
    static int cmd_quit(int argc, char** argv);

    // Notification path
    static void on_notification(const uint8_t* data, uint16_t len, void* ctx);
    static void notification_task(void* arg);
    static void cancel_isr(void* arg);
    void print_notification(const Notification& notification);
};
