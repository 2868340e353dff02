/*
+------------------------------------------------------------------------------------+
File        : SanImportCli.cpp

Description : Implements the command line interface for SanImportCli.

+------------------------------------------------------------------------------------+
*/
#include <fstream>
#include <iostream>
#include <sstream>

#include <boost/foreach.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>

#include "logger.h"
#include "errorexception.h"
#include "ImportSettings.h"
#include "ImportOrchestrator.h"
#include "SanRestClient.h"
#include "SanImportUtils.h"
#include "WwpnPrefixClassifier.h"
#include "SanImportCli.h"
#include "SanImportCliException.h"

using namespace SanImportLib;
using namespace SanImportCliOptions;
namespace po = boost::program_options;
using boost::property_tree::ptree;

bool ParseArgs(int argc, char *argv[], po::variables_map &commandOptions)
{
    po::options_description usage("Allowed options");
    usage.add_options()
        (SI_CLI_OPT_HELP, "show usage")
        (SI_CLI_OPT_CONF, po::value<std::string>(), "File path to the import settings ini")
        (SI_CLI_OPT_FABRIC, po::value<SanObjectId>(), "Id of the fabric the documents are imported into")
        (SI_CLI_OPT_FILE, po::value<std::vector<std::string> >(), "Switch configuration file to import, repeatable")
        (SI_CLI_OPT_ROLE_MODE, po::value<std::string>(), "init, target, both or smart")
        (SI_CLI_OPT_ALIAS_SYNTAX, po::value<std::string>(), "original, device-alias or fcalias")
        (SI_CLI_OPT_CONFLICT_POLICY, po::value<std::string>(), "prefer-device-alias or prefer-fcalias")
        (SI_CLI_OPT_ZONE_TYPE_MODE, po::value<std::string>(), "detect, standard, smart or peer")
        (SI_CLI_OPT_PREVIEW, "Print the prepared batch as JSON")
        (SI_CLI_OPT_SUBMIT, "Submit every new alias and zone and print the submission report as JSON")
        (SI_CLI_OPT_LOG_FILE, po::value<std::string>(), "Log File Path")
        (SI_CLI_OPT_LOG_LEVEL, po::value<std::string>(), "Log level name")
        ;

    po::store(po::parse_command_line(argc, argv, usage), commandOptions);
    po::notify(commandOptions);

    if (commandOptions.count(SI_CLI_OPT_HELP) || commandOptions.empty()) {
        std::cout << usage << "\n";
        return false;
    }

    return true;
}

void SetupLogging(const ImportSettings& settings, const po::variables_map& commandOptions)
{
    std::string logPath = settings.m_LogPath;
    if (commandOptions.count(SI_CLI_OPT_LOG_FILE))
        logPath = commandOptions[SI_CLI_OPT_LOG_FILE].as<std::string>();

    std::string levelName = settings.m_LogLevel;
    if (commandOptions.count(SI_CLI_OPT_LOG_LEVEL))
        levelName = commandOptions[SI_CLI_OPT_LOG_LEVEL].as<std::string>();

    SI_LOG_LEVEL level;
    if (!GetLogLevel(levelName, level))
    {
        throw SanImportCliException("invalid log level " + levelName, SI_CLI_INVALID_ARGUMENT);
    }

    SetLogLevel(level);
    SetLogMaxSize(settings.m_LogMaxSizeBytes);
    if (!logPath.empty())
        SetLogFileName(logPath.c_str());

    std::string activeLevel;
    if (GetLogLevelName(level, activeLevel))
        DebugPrintf(SI_LOG_ALWAYS, "SanImportCli logging at %s\n", activeLevel.c_str());
}

void ApplyOverrides(ImportSettings& settings, const po::variables_map& commandOptions)
{
    if (commandOptions.count(SI_CLI_OPT_ROLE_MODE))
        settings.SetRoleMode(commandOptions[SI_CLI_OPT_ROLE_MODE].as<std::string>());

    if (commandOptions.count(SI_CLI_OPT_ALIAS_SYNTAX))
        settings.SetAliasSyntax(commandOptions[SI_CLI_OPT_ALIAS_SYNTAX].as<std::string>());

    if (commandOptions.count(SI_CLI_OPT_CONFLICT_POLICY))
        settings.SetConflictPolicy(commandOptions[SI_CLI_OPT_CONFLICT_POLICY].as<std::string>());

    if (commandOptions.count(SI_CLI_OPT_ZONE_TYPE_MODE))
        settings.SetZoneTypeMode(commandOptions[SI_CLI_OPT_ZONE_TYPE_MODE].as<std::string>());
}

void ReadDocuments(const std::vector<std::string>& files, SourceDocuments_t& documents)
{
    BOOST_FOREACH(const std::string& file, files)
    {
        if (!boost::filesystem::exists(file))
        {
            throw SanImportCliException("file not found: " + file, SI_CLI_INVALID_ARGUMENT);
        }

        std::ifstream in(file.c_str(), std::ios::in | std::ios::binary);
        if (!in.good())
        {
            throw SanImportCliException("failed to open " + file, SI_CLI_INVALID_ARGUMENT);
        }

        std::stringstream text;
        text << in.rdbuf();
        documents.push_back(SourceDocument(boost::filesystem::path(file).filename().string(), text.str()));
        DebugPrintf(SI_LOG_INFO, "%s: read %s, %lu bytes\n", FUNCTION_NAME, file.c_str(), documents.back().Text.size());
    }
}

/// \brief prefix table used in smart role mode, null when it cannot be loaded
RoleClassifierPtr MakeRoleClassifier(const ImportSettings& settings, SanRestClient& client)
{
    WwpnPrefixClassifierPtr classifier(new WwpnPrefixClassifier());

    SISTATUS status = (settings.m_ClassifierMode == "file") ?
        classifier->LoadFromFile(settings.m_PrefixFile) :
        classifier->LoadFromService(client);

    if (SIS_OK != status)
    {
        DebugPrintf(SI_LOG_WARNING, "%s: prefix table not loaded from %s (%s), roles default to init\n",
            FUNCTION_NAME, settings.m_ClassifierMode.c_str(), SiStatusToString(status));
        return RoleClassifierPtr();
    }

    DebugPrintf(SI_LOG_INFO, "%s: loaded %lu prefix rules\n", FUNCTION_NAME, classifier->RuleCount());
    return classifier;
}

void PrintBatch(const ImportBatch& batch)
{
    ptree pt;
    batch.serialize(pt);
    std::cout << WriteTypedJson(pt) << std::endl;

    UnmatchedMembers_t unmatched = batch.UnmatchedMembers();
    BOOST_FOREACH(const UnmatchedMember& member, unmatched)
    {
        std::cerr << "Warning: zone " << member.ZoneName << " in " << member.SourceName
            << " line " << member.OriginLine << ": unresolved " << member.Kind
            << " " << member.RawToken << std::endl;
    }
}

int main(int argc, char *argv[])
{
    int status = SI_CLI_SUCCESS;

    try
    {
        po::variables_map commandOptions;
        if (!ParseArgs(argc, argv, commandOptions))
            return SI_CLI_SUCCESS;

        ImportSettingsPtr settings;
        if (commandOptions.count(SI_CLI_OPT_CONF))
            settings.reset(new ImportSettings(commandOptions[SI_CLI_OPT_CONF].as<std::string>()));
        else
            settings.reset(new ImportSettings());

        SetupLogging(*settings, commandOptions);
        ApplyOverrides(*settings, commandOptions);

        if (!commandOptions.count(SI_CLI_OPT_FABRIC) || !commandOptions.count(SI_CLI_OPT_FILE))
        {
            throw SanImportCliException("fabric and at least one file are required", SI_CLI_INVALID_ARGUMENT);
        }

        SanObjectId fabricId = commandOptions[SI_CLI_OPT_FABRIC].as<SanObjectId>();
        SourceDocuments_t documents;
        ReadDocuments(commandOptions[SI_CLI_OPT_FILE].as<std::vector<std::string> >(), documents);

        SanRestClientPtr client(new SanRestClient(settings->m_Backend));

        ImportOptions options;
        options.Aliases = settings->m_AliasDefaults;
        options.Zones = settings->m_ZoneDefaults;
        options.DumpSizeThreshold = settings->m_DumpSizeThresholdBytes;
        options.DividerMinLength = settings->m_DividerMinLength;
        options.RefreshPolicy = settings->m_RefreshPolicy;
        options.LockRetryPolicy = settings->m_LockRetryPolicy;
        options.ClassifierThreads = settings->m_ClassifierThreads;

        ImportOrchestrator orchestrator(client, options);
        if (ROLE_MODE_SMART == options.Aliases.Role)
            orchestrator.SetRoleClassifier(MakeRoleClassifier(*settings, *client));

        ImportBatch batch;
        SISTATUS ret = orchestrator.Prepare(fabricId, documents, batch);
        if (SIS_OK != ret)
        {
            throw SanImportCliException(std::string("prepare failed: ") + SiStatusToString(ret), SI_CLI_PREPARE_FAILED);
        }

        BOOST_FOREACH(const std::string& warning, batch.Warnings)
        {
            std::cerr << "Warning: " << warning << std::endl;
        }

        if (commandOptions.count(SI_CLI_OPT_PREVIEW) || !commandOptions.count(SI_CLI_OPT_SUBMIT))
        {
            PrintBatch(batch);
        }

        if (commandOptions.count(SI_CLI_OPT_SUBMIT))
        {
            orchestrator.SelectAllNew(batch);

            SubmissionReport report;
            ret = orchestrator.Submit(batch, report);
            std::cout << report.ToJson() << std::endl;

            if (SIE_PARTIAL_FAILURE == ret)
            {
                std::cerr << "Error: " << report.Failures.size() << " items were not created." << std::endl;
                status = SI_CLI_PARTIAL_FAILURE;
            }
            else if (SIS_OK != ret)
            {
                std::cerr << "Error: submission failed with " << SiStatusToString(ret) << "." << std::endl;
                status = SI_CLI_SUBMIT_FAILED;
            }
        }
    }
    catch (const SanImportCliException& cliex)
    {
        status = cliex.status();
        DebugPrintf(SI_LOG_ERROR, "Error: command failed with exception %s\n", cliex.what());
        std::cerr << "Error: " << cliex.what() << std::endl;
    }
    catch (const po::error& e)
    {
        DebugPrintf(SI_LOG_ERROR, "Error: invalid arguments %s\n", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        status = SI_CLI_INVALID_ARGUMENT;
    }
    catch (const ErrorException& e)
    {
        DebugPrintf(SI_LOG_ERROR, "Error: command failed with exception %s\n", e.what());
        std::cerr << "Error: command failed with exception : " << e.what() << std::endl;
        status = SI_CLI_INVALID_ARGUMENT;
    }
    catch (const std::exception& e)
    {
        DebugPrintf(SI_LOG_ERROR, "Error: command failed with exception %s\n", e.what());
        std::cerr << "Error: command failed with exception : " << e.what() << std::endl;
        status = SI_CLI_PREPARE_FAILED;
    }

    DebugPrintf(SI_LOG_INFO, "%s: Exiting with status %d.\n", FUNCTION_NAME, status);
    CloseDebug();
    return status;
}
