#include "lxcforge/recipes/pydev.hpp"

#include "lxcforge/common/fs.hpp"
#include "lxcforge/recipes/shared.hpp"
#include "lxcforge/recipes/templates.hpp"

#include <system_error>

namespace lxcforge::recipes {

namespace {

const std::vector<std::string> DEBIAN_PACKAGES = {"python3", "python3-pip", "python3-psycopg2",
                                                  "adduser", "sudo", "curl", "git"};
const std::vector<std::string> GUI_PACKAGES = {"libgtk2.0-0", "libxtst6"};
const std::vector<std::string> PYTHON_PACKAGES = {"Django==1.10"};

const std::vector<std::string> ECLIPSE_REPOSITORIES = {
    "http://pydev.org/updates",
    "http://download.eclipse.org/releases/neon",
    "http://eclipse.kacprzak.org/updates",
};
const std::vector<std::string> ECLIPSE_FEATURES = {
    "org.python.pydev.feature.feature.group",
    "org.eclipse.egit.feature.group",
    "org.eclipse.tm.terminal.feature.feature.group",
    "org.kacprzak.eclipse.django.feature.feature.group",
};

constexpr const char *JDK_URL =
    "https://edelivery.oracle.com/otn-pub/java/jdk/8u102-b14/jdk-8u102-linux-x64.tar.gz";
constexpr const char *ECLIPSE_URL =
    "http://download.eclipse.org/eclipse/downloads/drops4/R-4.6-201606061100/"
    "eclipse-platform-4.6-linux-gtk-x86_64.tar.gz";

constexpr const char *X11_SOCKET_DIR = "/tmp/.X11-unix";

} // namespace

std::filesystem::path launcher_path(const provision::RecipeContext &context) {
  return context.container_dir / "start-pydev";
}

std::string PydevRecipe::summary() const {
  return "Eclipse PyDev IDE displayed on the host's X server";
}

std::vector<provision::ConfigMutation>
PydevRecipe::pre_start_config(const provision::RecipeContext & /*context*/) const {
  std::vector<provision::ConfigMutation> mutations = {provision::ConfigMutation{
      .description = "Appending mount entry to config",
      .edits = {provision::ConfigEdit{
          .op = provision::ConfigOp::Append,
          .key = "lxc.mount.entry",
          .value = std::string(X11_SOCKET_DIR) + " tmp/.X11-unix none bind,optional,create=dir",
      }},
  }};
  for (auto &mutation : idmap_mutations()) {
    mutations.push_back(std::move(mutation));
  }
  return mutations;
}

std::vector<provision::Step> PydevRecipe::steps(const provision::RecipeContext &context) const {
  const std::string user = user_name(context.prefix);
  const std::string home = user_home(context.prefix);

  return {
      provision::Step::direct("Unmouting X11 directory", {"umount", X11_SOCKET_DIR}),
      apt_update_step(),
      apt_install_step("Installing debian packages", DEBIAN_PACKAGES),
      apt_install_step("Installing GUI packages", GUI_PACKAGES, true),
      pip_install_step(PYTHON_PACKAGES),
      add_user_step(context.prefix),
      set_password_step(user, password_),
      // sudo warns about an unresolvable host name without this.
      provision::Step::direct(
          "Appending container name to /etc/hosts",
          {"bash", "-c", "echo \"127.0.1.1       " + context.container_name + "\" >> /etc/hosts"}),
      provision::Step::piped(
          "Downloading and extracting Java JDK",
          {"bash", "-c",
           std::string("curl -L -H \"Cookie: oraclelicense=accept-securebackup-cookie\" -k \"") +
               JDK_URL + "\""},
          {"su", "-", user, "-c", "mkdir jdk && tar xz -C jdk --strip-components 1"}),
      provision::Step::piped("Downloading and extracting Eclipse IDE",
                             {"bash", "-c", std::string("curl -L -k \"") + ECLIPSE_URL + "\""},
                             {"su", "-", user, "-c", "tar xz"}),
      as_user_step("Updating Eclipse configuration", user,
                   "sed -i \"/-vmargs/i-data\\n" + home + "/workspace\\n-vm\\n" + home +
                       "/jdk/bin/java\" eclipse/eclipse.ini"),
      as_user_step("Installing PyDev", user,
                   "eclipse/eclipse -application org.eclipse.equinox.p2.director -noSplash "
                   "-repository " +
                       common::join(ECLIPSE_REPOSITORIES, ",") + " -installIU " +
                       common::join(ECLIPSE_FEATURES, ",")),
  };
}

std::vector<provision::HostAction>
PydevRecipe::host_actions(const provision::RecipeContext &context) const {
  const std::filesystem::path script = launcher_path(context);
  const std::string content = render_pydev_launcher(
      context.container_name, context.container_dir.parent_path().string(),
      user_name(context.prefix));

  return {
      provision::HostAction{
          .description = "Writing startup script",
          .run = [script, content]() { return common::write_text_file(script, content); },
      },
      provision::HostAction{
          .description = "Making script executable",
          .run =
              [script]() {
                std::error_code ec;
                std::filesystem::permissions(script,
                                             std::filesystem::perms::owner_all |
                                                 std::filesystem::perms::group_read |
                                                 std::filesystem::perms::others_read,
                                             std::filesystem::perm_options::replace, ec);
                if (ec) {
                  return common::Status::error("failed to chmod " + script.string() + ": " +
                                               ec.message());
                }
                return common::Status::success();
              },
      },
  };
}

std::map<std::string, std::string>
PydevRecipe::result_fields(const provision::RecipeContext &context) const {
  return {
      {"user_name", user_name(context.prefix)},
      {"user_password", password_},
      {"startup_script", launcher_path(context).string()},
  };
}

} // namespace lxcforge::recipes
