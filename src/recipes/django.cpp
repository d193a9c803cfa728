#include "lxcforge/recipes/django.hpp"

#include "lxcforge/recipes/shared.hpp"
#include "lxcforge/recipes/templates.hpp"

namespace lxcforge::recipes {

namespace {

const std::vector<std::string> DEBIAN_PACKAGES = {"python3", "python3-pip", "python3-psycopg2",
                                                  "nginx", "adduser", "openssh-server"};
const std::vector<std::string> PYTHON_PACKAGES = {"uWSGI==2.0.13.1", "Django==1.10",
                                                  "openpyxl==2.4.1"};

} // namespace

std::string project_name(const std::string &prefix) { return prefix + "_project"; }

std::string project_path(const std::string &prefix) {
  return user_home(prefix) + "/" + project_name(prefix);
}

std::string DjangoRecipe::summary() const {
  return "Django project behind nginx and uWSGI";
}

std::vector<provision::ConfigMutation>
DjangoRecipe::pre_start_config(const provision::RecipeContext & /*context*/) const {
  return idmap_mutations();
}

std::vector<provision::Step> DjangoRecipe::steps(const provision::RecipeContext &context) const {
  const std::string user = user_name(context.prefix);
  const std::string project = project_name(context.prefix);
  const std::string project_dir = project_path(context.prefix) + "/";
  const std::string site_conf = project_dir + project + "_nginx.conf";
  const std::string vassal_ini = project_dir + project + "_uwsgi.ini";

  return {
      apt_update_step(),
      apt_install_step("Installing debian packages", DEBIAN_PACKAGES),
      pip_install_step(PYTHON_PACKAGES),
      add_user_step(context.prefix),
      set_password_step(user, password_),
      as_user_step("Creating Django project", user, "django-admin.py startproject " + project),
      as_user_step("Appending configuration to settings.py", user,
                   "echo \"STATIC_ROOT = os.path.join(BASE_DIR, 'static') + os.sep\" >> " +
                       project_dir + project + "/settings.py"),
      as_user_step("Updating static files configuration", user,
                   "cd " + project + " && python3 manage.py collectstatic --noinput"),
      as_user_step("Creating media directory", user, "mkdir " + project_dir + "media"),
      write_file_step("Creating nginx configuration file", user,
                      render_nginx_site(project_dir + project, context.container_address,
                                        project_dir),
                      site_conf),
      as_user_step("Copying nginx uwsgi parameter file", user,
                   "cp /etc/nginx/uwsgi_params " + project_dir),
      provision::Step::direct("Removing default site",
                              {"rm", "-f", "/etc/nginx/sites-enabled/default"}),
      provision::Step::direct("Setting site status to active",
                              {"ln", "-s", site_conf, "/etc/nginx/sites-enabled/"}),
      provision::Step::direct("Restarting nginx", {"systemctl", "restart", "nginx"}),
      write_file_step("Creating uwsgi configuration file", user,
                      render_uwsgi_ini(project, user_home(context.prefix)), vassal_ini),
      provision::Step::direct("Creating uwsgi configuration directory",
                              {"mkdir", "-p", "/etc/uwsgi/vassals"}),
      provision::Step::direct("Linking uwsgi configuration",
                              {"ln", "-s", vassal_ini, "/etc/uwsgi/vassals/"}),
      write_file_step("Creating uwsgi service", "", uwsgi_emperor_unit(),
                      "/lib/systemd/system/uwsgi.service"),
      provision::Step::direct("Activating uwsgi service", {"systemctl", "enable", "uwsgi"}),
      provision::Step::direct("Starting uwsgi service", {"systemctl", "start", "uwsgi"}),
  };
}

std::map<std::string, std::string>
DjangoRecipe::result_fields(const provision::RecipeContext &context) const {
  return {
      {"user_name", user_name(context.prefix)},
      {"user_password", password_},
      {"project_path", project_path(context.prefix)},
  };
}

} // namespace lxcforge::recipes
