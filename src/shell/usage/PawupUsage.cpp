#include "shell/usage/PawupUsage.hpp"

using namespace pawup::shell;

CommandBook PawupUsage::all() {
    CommandBook book;
    book.title = "pawup: SourcePawn compiler toolchain manager";
    book.commands = {
        config(),
        defaultSelector(),
        alias(),
        show(),
        update(),
        install(),
        remove(),
        purge(),
        help(),
        version()
    };
    return book;
}

CommandUsage PawupUsage::config() {
    CommandUsage cmd;
    cmd.command = "config";
    cmd.description = "Print the path and contents of the configuration file.";
    cmd.examples.push_back({"pawup config", ""});
    return cmd;
}

CommandUsage PawupUsage::defaultSelector() {
    CommandUsage cmd;
    cmd.command = "default";
    cmd.description = "Print the default toolchain selector, or replace it.";
    cmd.positionals = {{"[selector]", "New default, an alias name or ':' followed by a version prefix"}};
    cmd.examples.push_back({"pawup default", "Show the current default."});
    cmd.examples.push_back({"pawup default :1.12", "Use the newest installed 1.12 toolchain."});
    return cmd;
}

CommandUsage PawupUsage::alias() {
    CommandUsage cmd;
    cmd.command = "alias";
    cmd.description = "Print the version an alias points to, or point it at a version.";
    cmd.positionals = {
        {"<name>", "Alias name; must not start with ':'"},
        {"[version]", "Exact toolchain version"}
    };
    cmd.examples.push_back({"pawup alias stable", ""});
    cmd.examples.push_back({"pawup alias work 1.11.0.6970", ""});
    return cmd;
}

CommandUsage PawupUsage::show() {
    CommandUsage cmd;
    cmd.command = "show";
    cmd.aliases = {"list", "ls"};
    cmd.description = "List installed toolchains in every toolchain directory.";
    return cmd;
}

CommandUsage PawupUsage::update() {
    CommandUsage cmd;
    cmd.command = "update";
    cmd.aliases = {"up"};
    cmd.description = "Fetch the newest release of a branch if it is newer than what is installed, "
                      "then point an alias at it.";
    cmd.positionals = {
        {"[selector]", "Branch to follow; defaults to the configured default"},
        {"[alias]", "Alias to update; defaults to the selector when it is an alias"}
    };
    cmd.optional = {{"--redownload", "Download even if the version is already installed", {"-r"}}};
    cmd.examples.push_back({"pawup update", "Update the default toolchain."});
    cmd.examples.push_back({"pawup update latest", "Track the newest development branch."});
    cmd.examples.push_back({"pawup update :1.11 legacy", "Point 'legacy' at the newest 1.11 release."});
    return cmd;
}

CommandUsage PawupUsage::install() {
    CommandUsage cmd;
    cmd.command = "install";
    cmd.aliases = {"add"};
    cmd.description = "Download and install the newest release matching a selector.";
    cmd.positionals = {{"<selector>", "Alias name or ':' followed by a version prefix"}};
    cmd.optional = {{"--redownload", "Download even if the version is already installed", {"-r"}}};
    cmd.examples.push_back({"pawup install :1.12.0.7192", ""});
    return cmd;
}

CommandUsage PawupUsage::remove() {
    CommandUsage cmd;
    cmd.command = "remove";
    cmd.aliases = {"rm", "uninstall"};
    cmd.description = "Delete downloaded toolchains matching a selector. Hand-installed toolchains are never touched.";
    cmd.positionals = {{"<selector>", "Alias name or ':' followed by a version prefix"}};
    cmd.examples.push_back({"pawup remove :1.10", "Delete every downloaded 1.10 toolchain."});
    return cmd;
}

CommandUsage PawupUsage::purge() {
    CommandUsage cmd;
    cmd.command = "purge";
    cmd.description = "Delete downloaded toolchains that no alias and not the default refer to.";
    cmd.optional = {{"--dry-run", "Only list what would be deleted", {"-n"}}};
    return cmd;
}

CommandUsage PawupUsage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.aliases = {"--help", "-h"};
    cmd.description = "Show help for all commands or one command.";
    cmd.positionals = {{"[command]", "Command to describe"}};
    return cmd;
}

CommandUsage PawupUsage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.aliases = {"--version", "-V"};
    cmd.description = "Show the pawup version.";
    return cmd;
}
