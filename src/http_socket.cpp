// HTTP/1.1 client over POSIX sockets, with OpenSSL for https URLs.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace sandlot {

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("http: unsupported scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("http: missing host in URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Throws std::runtime_error describing the failed stage.
    void open(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            throw std::runtime_error("http: cannot resolve " + url.host + ": " + gai_strerror(gai));

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;

            // Non-blocking connect so the timeout applies.
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
            }
            if (connected) {
                fcntl(fd_, F_SETFL, flags);
            } else {
                ::close(fd_);
                fd_ = -1;
            }
        }
        freeaddrinfo(res);
        if (!connected)
            throw std::runtime_error("http: cannot connect to " + url.host + ":" + url.port);

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!url.tls) return;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) throw std::runtime_error("http: SSL_CTX_new failed");
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) throw std::runtime_error("http: SSL_new failed");
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

        if (SSL_connect(ssl_) != 1) {
            char buf[256];
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            throw std::runtime_error("http: TLS handshake with " + url.host + " failed: " + buf);
        }
    }

    // >0 bytes read, 0 on EOF, -1 on error or timeout.
    ssize_t read_some(char* buf, size_t len) {
        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            return SSL_get_error(ssl_, n) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
        }
        for (;;) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno != EINTR) return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, 0);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Buffered reader over a connection.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Next CRLF-terminated line, or the unterminated remainder at EOF.
    std::string line() {
        for (;;) {
            size_t pos = buf_.find('\n');
            if (pos != std::string::npos) {
                std::string out = buf_.substr(0, pos);
                buf_.erase(0, pos + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return out;
            }
            if (!fill()) {
                std::string out = std::move(buf_);
                buf_.clear();
                return out;
            }
        }
    }

    bool exactly(size_t n, std::string& out) {
        while (buf_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buf_, 0, n);
        buf_.erase(0, n);
        return true;
    }

    void rest(std::string& out) {
        while (fill()) {
        }
        out += buf_;
        buf_.clear();
    }

    bool eof() const { return eof_; }

private:
    bool fill() {
        if (eof_) return false;
        char chunk[4096];
        ssize_t n = conn_.read_some(chunk, sizeof(chunk));
        if (n <= 0) {
            eof_ = true;
            return false;
        }
        buf_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    Connection& conn_;
    std::string buf_;
    bool eof_ = false;
};

static std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

HttpResponse SocketHttpClient::post(const std::string& url_str,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    ParsedUrl url = parse_url(url_str);

    Connection conn;
    conn.open(url, timeout_seconds);

    std::string request = build_request(url, body, headers);
    if (!conn.write_all(request.c_str(), request.size()))
        throw std::runtime_error("http: failed to send request to " + url.host);

    ResponseReader reader(conn);

    // "HTTP/1.1 200 OK"
    std::string status_line = reader.line();
    size_t sp = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || sp == std::string::npos ||
        sp + 4 > status_line.size() ||
        !std::all_of(status_line.begin() + static_cast<long>(sp) + 1,
                     status_line.begin() + static_cast<long>(sp) + 4,
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        throw std::runtime_error("http: malformed response from " + url.host);
    }

    HttpResponse resp;
    resp.status_code = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);

    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
    for (;;) {
        std::string line = reader.line();
        if (line.empty()) break; // end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lowercase(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        if (name == "transfer-encoding") {
            is_chunked = lowercase(value).find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            char* end = nullptr;
            unsigned long long n = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                content_length = static_cast<size_t>(n);
                has_length = true;
            }
        }
    }

    if (is_chunked) {
        for (;;) {
            std::string size_line = reader.line();
            if (size_line.empty() && reader.eof()) break;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            if (!reader.exactly(chunk_size, resp.body)) break;
            reader.line(); // trailing CRLF
        }
    } else if (has_length) {
        if (!reader.exactly(content_length, resp.body))
            throw std::runtime_error("http: truncated response from " + url.host);
    } else {
        reader.rest(resp.body);
    }
    return resp;
}

} // namespace sandlot
