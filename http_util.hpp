#ifndef http_util_h
#define http_util_h

#include <string>

/* Where the rqbit API lives, split out of its base URL */
struct http_endpoint {
  std::string host;
  std::string port;
  /* path prefix without trailing slash, empty for the server root */
  std::string base_path;
};

/* Accepts http://host[:port][/prefix]. Returns false for anything else */
bool parse_http_url(const std::string &url, http_endpoint &endpoint);

/* Value for the Authorization header, "Basic <base64(user:pass)>" */
std::string basic_auth_header(const std::string &username,
                              const std::string &password);

#endif //http_util_h
