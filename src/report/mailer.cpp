#include "patchguard/report.hpp"

#include <cstring>
#include <ctime>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace patchguard {

namespace {

// Upload cursor over the composed message
struct Payload {
    const std::string* text;
    size_t offset;
};

size_t curl_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* payload = static_cast<Payload*>(userdata);
    size_t room = size * nitems;
    size_t remaining = payload->text->size() - payload->offset;
    size_t count = remaining < room ? remaining : room;
    if (count > 0) {
        std::memcpy(buffer, payload->text->data() + payload->offset, count);
        payload->offset += count;
    }
    return count;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a recipient list
class CurlSlist {
public:
    CurlSlist() = default;
    ~CurlSlist() { if (list_) curl_slist_free_all(list_); }

    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;

    bool append(const std::string& item) {
        curl_slist* next = curl_slist_append(list_, item.c_str());
        if (!next) return false;
        list_ = next;
        return true;
    }

    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

std::string angle_address(const std::string& address) {
    if (!address.empty() && address.front() == '<') return address;
    return "<" + address + ">";
}

std::string rfc5322_date() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);

    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &tm_buf);
    return buf;
}

} // namespace

std::string compose_mail(const MailMessage& message) {
    std::string text;
    text += "Date: " + rfc5322_date() + "\r\n";
    text += "From: " + message.sender + "\r\n";

    text += "To: ";
    for (size_t i = 0; i < message.recipients.size(); ++i) {
        if (i > 0) text += ", ";
        text += message.recipients[i];
    }
    text += "\r\n";

    text += "Subject: " + message.subject + "\r\n";
    text += "MIME-Version: 1.0\r\n";
    text += "Content-Type: text/plain; charset=utf-8\r\n";
    text += "\r\n";

    // Body lines must end in CRLF
    for (size_t i = 0; i < message.body.size(); ++i) {
        char c = message.body[i];
        if (c == '\n' && (i == 0 || message.body[i - 1] != '\r')) {
            text += '\r';
        }
        text += c;
    }
    if (text.size() < 2 || text.compare(text.size() - 2, 2, "\r\n") != 0) {
        text += "\r\n";
    }
    return text;
}

MailResult send_mail(const std::string& smtp_url, const MailMessage& message) {
    MailResult result;

    if (smtp_url.empty()) {
        result.error = "no SMTP server configured";
        return result;
    }
    if (message.recipients.empty()) {
        result.error = "no recipients configured";
        return result;
    }

    // Ensure global initialization
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    CurlSlist recipients;
    for (const auto& recipient : message.recipients) {
        if (!recipients.append(angle_address(recipient))) {
            result.error = "failed to build recipient list";
            return result;
        }
    }

    std::string text = compose_mail(message);
    Payload payload{&text, 0};
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, smtp_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, angle_address(message.sender).c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, curl_read_callback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // Use TLS when the server offers it
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 120L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = std::string("SMTP delivery failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    result.ok = true;
    return result;
}

MailResult send_report_mail(const IntegrityConfig& config, const std::string& report_text) {
    const auto& notification = config.notification;

    MailMessage message;
    message.sender = notification.sender;
    message.recipients = notification.recipients;
    message.subject = notification.subject;
    message.body = report_text;

    auto result = send_mail(notification.smtp_url, message);
    if (result.ok) {
        spdlog::info("Report mailed to {} recipient(s)", message.recipients.size());
    }
    return result;
}

} // namespace patchguard
