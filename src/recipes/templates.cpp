#include "lxcforge/recipes/templates.hpp"

#include "lxcforge/recipes/shared.hpp"

namespace lxcforge::recipes {

namespace {

constexpr const char *NGINX_SITE = R"(# the upstream component nginx needs to connect to
upstream django {
    server unix://{socket}.sock; # for a file socket
}

# configuration of the server
server {
    # the port your site will be served on
    listen      80;
    # the domain name it will serve for
    server_name {server_name};
    charset     utf-8;

    # max upload size
    client_max_body_size 75M;

    location = /favicon.ico { access_log off; log_not_found off; }

    # Django media
    location /media  {
        alias {project_dir}media;
    }

    location /static {
        alias {project_dir}static;
    }

    # Finally, send all non-media requests to the Django server.
    location / {
        uwsgi_pass  django;
        include     {project_dir}uwsgi_params;
    }
}
)";

constexpr const char *UWSGI_INI = R"([uwsgi]
project         = {project}
base            = {base}

# Django-related settings
chdir           = %(base)/%(project)
module          = %(project).wsgi

# process-related settings
master          = true
processes       = 5
socket          = %(base)/%(project)/%(project).sock
chmod-socket    = 666
vacuum          = true
daemonize       = /var/log/uwsgi-emperor.log
)";

constexpr const char *UWSGI_UNIT = R"([Unit]
Description=uWSGI Emperor
After=syslog.target

[Service]
ExecStart=/usr/local/bin/uwsgi --emperor /etc/uwsgi/vassals
Restart=always
KillSignal=SIGQUIT
Type=notify
StandardError=syslog
NotifyAccess=all

[Install]
WantedBy=multi-user.target
)";

constexpr const char *PYDEV_LAUNCHER = R"(#!/bin/sh
CONTAINER={container}
LXCPATH={lxc_path}
CMD_LINE="eclipse/eclipse $*"

STARTED=false

if ! lxc-wait -P "$LXCPATH" -n $CONTAINER -s RUNNING -t 0; then
    lxc-start -P "$LXCPATH" -n $CONTAINER -d
    lxc-wait -P "$LXCPATH" -n $CONTAINER -s RUNNING
    STARTED=true
fi

lxc-attach -P "$LXCPATH" --clear-env -n $CONTAINER -- sudo -u {user} -i env DISPLAY=$DISPLAY $CMD_LINE

if [ "$STARTED" = "true" ]; then
    lxc-stop -P "$LXCPATH" -n $CONTAINER -t 10
fi
)";

} // namespace

std::string render_nginx_site(const std::string &socket_base, const std::string &server_name,
                              const std::string &project_dir) {
  return fill_template(NGINX_SITE, {{"socket", socket_base},
                                    {"server_name", server_name},
                                    {"project_dir", project_dir}});
}

std::string render_uwsgi_ini(const std::string &project, const std::string &base) {
  return fill_template(UWSGI_INI, {{"project", project}, {"base", base}});
}

std::string uwsgi_emperor_unit() { return UWSGI_UNIT; }

std::string shell_single_quote(const std::string &value) {
  std::string quoted = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string render_pydev_launcher(const std::string &container, const std::string &lxc_path,
                                  const std::string &user) {
  return fill_template(PYDEV_LAUNCHER, {{"container", container},
                                        {"lxc_path", shell_single_quote(lxc_path)},
                                        {"user", user}});
}

} // namespace lxcforge::recipes
