#pragma once

#include <string>

namespace lxcforge::recipes {

/// nginx site forwarding to the project's uWSGI socket.
/// `socket_base` is the socket path without ".sock"; `project_dir` ends with '/'.
[[nodiscard]] std::string render_nginx_site(const std::string &socket_base,
                                            const std::string &server_name,
                                            const std::string &project_dir);

/// uWSGI vassal ini for a Django project living at `<base>/<project>`.
[[nodiscard]] std::string render_uwsgi_ini(const std::string &project, const std::string &base);

/// systemd unit running the uWSGI emperor over /etc/uwsgi/vassals.
[[nodiscard]] std::string uwsgi_emperor_unit();

/// `value` as one POSIX shell word in single quotes.
[[nodiscard]] std::string shell_single_quote(const std::string &value);

/// Host script that starts the sandbox if needed, runs Eclipse as `user` on the host's
/// display, and stops the sandbox again if it started it.
[[nodiscard]] std::string render_pydev_launcher(const std::string &container,
                                                const std::string &lxc_path,
                                                const std::string &user);

} // namespace lxcforge::recipes
