#include "RelayUrl.hpp"

namespace pt {
RelayUrl RelayUrl::parse(const string& url) {
  RelayUrl result;
  string rest;
  if (url.rfind("wss://", 0) == 0) {
    result.secure = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    result.secure = false;
    rest = url.substr(5);
  } else {
    throw std::runtime_error("Unsupported relay url (expected ws:// or wss://): " +
                             url);
  }

  auto slash = rest.find('/');
  string authority = slash == string::npos ? rest : rest.substr(0, slash);
  result.target = slash == string::npos ? "/" : rest.substr(slash);

  result.port = result.secure ? 443 : 80;
  string host = authority;
  bool bracketed = !authority.empty() && authority[0] == '[';
  if (bracketed) {
    // IPv6 literal
    auto close = authority.find(']');
    if (close == string::npos) {
      throw std::runtime_error("Malformed host in relay url: " + url);
    }
    host = authority.substr(1, close - 1);
    string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after[0] != ':') {
        throw std::runtime_error("Malformed host in relay url: " + url);
      }
      authority = after;
    } else {
      authority.clear();
    }
  }
  auto colon = authority.rfind(':');
  if (colon != string::npos) {
    string portString = authority.substr(colon + 1);
    if (!bracketed) {
      host = authority.substr(0, colon);
    }
    if (portString.empty() || portString.size() > 5 ||
        portString.find_first_not_of("0123456789") != string::npos) {
      throw std::runtime_error("Invalid port in relay url: " + url);
    }
    int port = stoi(portString);
    if (port <= 0 || port > 65535) {
      throw std::runtime_error("Invalid port in relay url: " + url);
    }
    result.port = port;
  }
  if (host.empty()) {
    throw std::runtime_error("Missing host in relay url: " + url);
  }
  result.host = host;
  return result;
}

string RelayUrl::socketEndpoint(const string& relayUrl) {
  string base = relayUrl;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/ws";
}

string RelayUrl::toString() const {
  string s = secure ? "wss://" : "ws://";
  if (host.find(':') != string::npos) {
    s += "[" + host + "]";
  } else {
    s += host;
  }
  if (port != (secure ? 443 : 80)) {
    s += ":" + to_string(port);
  }
  return s + target;
}
}  // namespace pt
