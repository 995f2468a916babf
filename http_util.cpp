#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include "http_util.hpp"

namespace bai = boost::archive::iterators;

bool parse_http_url(const std::string &url, http_endpoint &endpoint) {
  static const std::string scheme = "http://";
  std::string trimmed = boost::algorithm::trim_copy(url);
  if (!boost::algorithm::istarts_with(trimmed, scheme))
    return false;

  std::string rest = trimmed.substr(scheme.size());
  std::string::size_type slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  std::string path = slash == std::string::npos ? "" : rest.substr(slash);

  if (authority.empty() || authority.find('@') != std::string::npos)
    return false;

  std::string host = authority;
  std::string port = "80";
  std::string::size_type colon = authority.rfind(':');
  if (colon != std::string::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
    if (port.empty() || !boost::algorithm::all(port, boost::algorithm::is_digit()))
      return false;
  }
  if (host.empty())
    return false;

  while (!path.empty() && path[path.size() - 1] == '/')
    path.erase(path.size() - 1);

  endpoint.host = host;
  endpoint.port = port;
  endpoint.base_path = path;
  return true;
}

std::string basic_auth_header(const std::string &username,
                              const std::string &password) {
  typedef bai::base64_from_binary<
    bai::transform_width<std::string::const_iterator, 6, 8> > base64_iter;

  std::string credentials = username + ":" + password;
  std::string encoded(base64_iter(credentials.begin()),
                      base64_iter(credentials.end()));
  encoded.append((3 - credentials.size() % 3) % 3, '=');
  return "Basic " + encoded;
}
