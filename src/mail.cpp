#include "sgaudit/mail.hpp"
#include "sgaudit/errors.hpp"
#include "sgaudit/log.hpp"

#include <boost/asio.hpp>

#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <istream>
#include <random>

namespace asio = boost::asio;
using asio::ip::tcp;

namespace sgaudit {

namespace {

bool has_line_break(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// RFC 5322 date in UTC, independent of the process locale.
std::string rfc5322_date(std::chrono::system_clock::time_point at) {
    static const char* const kDays[]   = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
    static const char* const kMonths[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                           "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm tm {};
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d +0000",
                  kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string message_id(const std::string& sender, std::chrono::system_clock::time_point at) {
    auto at_sign = sender.rfind('@');
    std::string domain = at_sign == std::string::npos || at_sign + 1 == sender.size()
                             ? "localhost" : sender.substr(at_sign + 1);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        at.time_since_epoch()).count();
    std::random_device rd;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%lld.%08x%08x", static_cast<long long>(millis),
                  rd(), rd());
    return "<" + std::string(buf) + "@" + domain + ">";
}

void validate(const MailMessage& message) {
    if (message.recipients.empty()) {
        throw DispatchError("mail message has no recipients");
    }
    if (has_line_break(message.sender) || has_line_break(message.subject)) {
        throw DispatchError("mail sender or subject contains a line break");
    }
    for (const auto& r : message.recipients) {
        if (r.empty() || has_line_break(r)) {
            throw DispatchError("invalid recipient address '" + r + "'");
        }
    }
}

// Blocking SMTP dialogue over one TCP connection.
class SmtpSession {
public:
    explicit SmtpSession(asio::io_context& io) : io_(io), socket_(io) {}

    void connect(const std::string& host, unsigned short port) {
        tcp::resolver resolver(io_);
        asio::connect(socket_, resolver.resolve(host, std::to_string(port)));
    }

    void expect(std::initializer_list<int> codes, const std::string& stage) {
        std::string reply = read_reply();
        int code = reply_code(reply);
        for (int c : codes)
            if (c == code) return;
        throw DispatchError("SMTP " + stage + " rejected: " + reply);
    }

    void command(const std::string& line, std::initializer_list<int> codes,
                 const std::string& stage) {
        write(line + "\r\n");
        expect(codes, stage);
    }

    void write(const std::string& data) {
        asio::write(socket_, asio::buffer(data));
    }

    void quit() {
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(std::string("QUIT\r\n")), ec);
        if (!ec) asio::read_until(socket_, buffer_, "\r\n", ec);
        if (ec) log_debug("SMTP QUIT not acknowledged: " + ec.message());
        socket_.close(ec);
    }

private:
    // Reads a complete reply, following "250-" continuation lines.
    std::string read_reply() {
        std::string reply;
        for (;;) {
            asio::read_until(socket_, buffer_, "\r\n");
            std::istream is(&buffer_);
            std::string line;
            std::getline(is, line);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (!reply.empty()) reply += " | ";
            reply += line;
            if (line.size() < 4 || line[3] != '-') break;
        }
        return reply;
    }

    static int reply_code(const std::string& reply) {
        if (reply.size() < 3) return -1;
        int code = 0;
        for (std::size_t i = 0; i < 3; ++i) {
            char c = reply[i];
            if (c < '0' || c > '9') return -1;
            code = code * 10 + (c - '0');
        }
        return code;
    }

    asio::io_context& io_;
    tcp::socket       socket_;
    asio::streambuf   buffer_;
};

} // namespace

std::string format_smtp_payload(const MailMessage& message,
                                std::chrono::system_clock::time_point sent_at) {
    std::string out;
    out += "Date: " + rfc5322_date(sent_at) + "\r\n";
    out += "Message-ID: " + message_id(message.sender, sent_at) + "\r\n";
    out += "From: " + message.sender + "\r\n";
    out += "To: " + join(message.recipients, ", ") + "\r\n";
    out += "Subject: " + message.subject + "\r\n";
    out += "MIME-Version: 1.0\r\n";
    out += "Content-Type: text/plain; charset=UTF-8\r\n";
    out += "Content-Transfer-Encoding: 8bit\r\n";
    out += "\r\n";

    std::size_t pos = 0;
    const std::string& body = message.body;
    while (pos < body.size()) {
        std::size_t end = body.find('\n', pos);
        std::string line = body.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty() && line.front() == '.') line.insert(line.begin(), '.');
        out += line + "\r\n";
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    return out;
}

// ── SmtpMailSender ───────────────────────────────────────────────────────────

SmtpMailSender::SmtpMailSender(std::string host, unsigned short port, std::string helo_domain)
    : host_(std::move(host)), port_(port), helo_domain_(std::move(helo_domain)) {}

void SmtpMailSender::send(const MailMessage& message) {
    validate(message);

    asio::io_context io;
    SmtpSession session(io);
    try {
        session.connect(host_, port_);
        session.expect({ 220 }, "greeting");
        session.command("EHLO " + helo_domain_, { 250 }, "EHLO");
        session.command("MAIL FROM:<" + message.sender + ">", { 250 }, "MAIL FROM");
        for (const auto& r : message.recipients)
            session.command("RCPT TO:<" + r + ">", { 250, 251 }, "RCPT TO " + r);
        session.command("DATA", { 354 }, "DATA");
        session.write(format_smtp_payload(message));
        session.command(".", { 250 }, "message body");
    } catch (const boost::system::system_error& e) {
        throw DispatchError("SMTP relay " + host_ + ":" + std::to_string(port_) +
                            " failed: " + e.code().message());
    }
    session.quit();

    log_debug("SMTP relay " + host_ + " accepted message for " + join(message.recipients, ", "));
}

} // namespace sgaudit
