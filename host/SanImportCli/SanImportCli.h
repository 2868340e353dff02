/*
+------------------------------------------------------------------------------------+
File        : SanImportCli.h

Description : Contains definitions related to command line interface SanImportCli.

+------------------------------------------------------------------------------------+
*/
#pragma once

namespace SanImportCliOptions {

    const char SI_CLI_OPT_HELP[] = "help";
    const char SI_CLI_OPT_CONF[] = "conf";
    const char SI_CLI_OPT_FABRIC[] = "fabric";
    const char SI_CLI_OPT_FILE[] = "file";

    const char SI_CLI_OPT_ROLE_MODE[] = "role-mode";
    const char SI_CLI_OPT_ALIAS_SYNTAX[] = "alias-syntax";
    const char SI_CLI_OPT_CONFLICT_POLICY[] = "conflict-policy";
    const char SI_CLI_OPT_ZONE_TYPE_MODE[] = "zone-type-mode";

    const char SI_CLI_OPT_PREVIEW[] = "preview";
    const char SI_CLI_OPT_SUBMIT[] = "submit";

    const char SI_CLI_OPT_LOG_FILE[] = "logfile";
    const char SI_CLI_OPT_LOG_LEVEL[] = "loglevel";
}

typedef enum SanImportCliErrorCodes {
    SI_CLI_SUCCESS = 0,
    SI_CLI_INVALID_ARGUMENT = 1,
    SI_CLI_PREPARE_FAILED = 2,
    SI_CLI_PARTIAL_FAILURE = 3,
    SI_CLI_SUBMIT_FAILED = 4
} SanImportCliErrorCodes_t;
