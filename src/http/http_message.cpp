/// @file http_message.cpp
/// @brief In-memory HttpRequest / HttpResponse.

#include "latchkey/http/http_types.hpp"

namespace latchkey::http {

// ---------------------------------------------------------------------------
// HttpRequest
// ---------------------------------------------------------------------------

HttpRequest& HttpRequest::setMethod(std::string method) {
    method_ = std::move(method);
    return *this;
}

HttpRequest& HttpRequest::setPath(std::string path) {
    path_ = std::move(path);
    return *this;
}

HttpRequest& HttpRequest::setHeader(std::string_view name, std::string value) {
    headers_[normalizeHeaderName(name)] = std::move(value);
    return *this;
}

HttpRequest& HttpRequest::addCookie(std::string_view name, std::string_view value) {
    auto& cookieHeader = headers_["cookie"];
    if (!cookieHeader.empty()) {
        cookieHeader += "; ";
    }
    cookieHeader += name;
    cookieHeader += '=';
    cookieHeader += value;
    return *this;
}

HttpRequest& HttpRequest::setFormField(std::string name, std::string value) {
    form_[std::move(name)] = std::move(value);
    return *this;
}

HttpRequest& HttpRequest::setRemoteAddress(std::string address) {
    remoteAddress_ = std::move(address);
    return *this;
}

HttpRequest& HttpRequest::setSessionUser(std::optional<UserId> user) {
    sessionUser_ = user;
    return *this;
}

std::string HttpRequest::method() const {
    return method_;
}

std::string HttpRequest::path() const {
    return path_;
}

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers_.find(normalizeHeaderName(name));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> HttpRequest::cookie(std::string_view name) const {
    auto it = headers_.find("cookie");
    if (it == headers_.end()) {
        return std::nullopt;
    }
    auto cookies = parseCookieHeader(it->second);
    auto found = cookies.find(std::string(name));
    if (found == cookies.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::optional<std::string> HttpRequest::formField(std::string_view name) const {
    auto it = form_.find(name);
    if (it == form_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> HttpRequest::remoteAddress() const {
    return remoteAddress_;
}

std::optional<UserId> HttpRequest::sessionUser() const {
    return sessionUser_;
}

std::optional<UserRecord> HttpRequest::rememberMeUser() const {
    return rememberMeUser_;
}

void HttpRequest::setRememberMeUser(UserRecord user) {
    rememberMeUser_ = std::move(user);
}

// ---------------------------------------------------------------------------
// HttpResponse
// ---------------------------------------------------------------------------

void HttpResponse::setHeader(std::string_view name, std::string value) {
    auto& values = headers_[normalizeHeaderName(name)];
    values.clear();
    values.push_back(std::move(value));
}

void HttpResponse::appendHeader(std::string_view name, std::string value) {
    headers_[normalizeHeaderName(name)].push_back(std::move(value));
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers_.find(normalizeHeaderName(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<std::string> HttpResponse::headerValues(std::string_view name) const {
    auto it = headers_.find(normalizeHeaderName(name));
    if (it == headers_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> HttpResponse::setCookies() const {
    return headerValues("Set-Cookie");
}

} // namespace latchkey::http
