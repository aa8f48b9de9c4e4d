#include <torctl/auth/auth_options.hpp>

namespace torctl::auth {

AuthOptions MakeAuthOptions() noexcept {
  AuthOptions auth_options;
  auth_options.AddAuthMethod<AuthMethod::kNone>();
  auth_options.AddAuthMethod<AuthMethod::kCookie>();
  return auth_options;
}

}  // namespace torctl::auth
