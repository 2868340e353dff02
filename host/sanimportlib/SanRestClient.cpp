/*
+------------------------------------------------------------------------------------+
File        : SanRestClient.cpp

Description : SanRestClient implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/bind.hpp>
#include <boost/ref.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "SanRestClient.h"
#include "SanImportUtils.h"
#include "SanImportConstants.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        /// \brief guards against a service that keeps returning a "next" link
        const size_t MAX_LIST_PAGES = 10000;

        /// \brief response bodies are logged up to this length
        const size_t MAX_LOGGED_BODY = 512;

        std::string Abbreviate(const std::string& body)
        {
            return (body.size() > MAX_LOGGED_BODY) ? body.substr(0, MAX_LOGGED_BODY) + "..." : body;
        }

        void AppendAlias(SanObjectId fabricId, PersistedAliases_t& aliases, const boost::property_tree::ptree& item)
        {
            boost::optional<SanObjectId> id = item.get_optional<SanObjectId>(SanRestJson::Id);
            if (!id)
            {
                DebugPrintf(SI_LOG_WARNING, "%s: skipping alias without an id\n", FUNCTION_NAME);
                return;
            }

            aliases.push_back(PersistedAlias(*id,
                item.get(SanRestJson::Name, std::string()),
                item.get(SanRestJson::Wwpn, std::string()),
                item.get(SanRestJson::Fabric, fabricId)));
        }

        void AppendZone(SanObjectId fabricId, PersistedZones_t& zones, const boost::property_tree::ptree& item)
        {
            boost::optional<SanObjectId> id = item.get_optional<SanObjectId>(SanRestJson::Id);
            if (!id)
            {
                DebugPrintf(SI_LOG_WARNING, "%s: skipping zone without an id\n", FUNCTION_NAME);
                return;
            }

            zones.push_back(PersistedZone(*id,
                item.get(SanRestJson::Name, std::string()),
                item.get(SanRestJson::Fabric, fabricId)));
        }

        /// \brief reason text of one entry of an "errors" list
        ///
        /// entries are {"name": .., "error": ..} objects, plain strings, or
        /// field keyed lists of messages
        std::string ErrorReason(const boost::property_tree::ptree& entry)
        {
            std::string reason = entry.get(SanRestJson::Error, std::string());
            if (reason.empty())
            {
                reason = entry.get(SanRestJson::Message, std::string());
            }
            if (reason.empty())
            {
                reason = entry.data();
            }
            if (reason.empty())
            {
                std::vector<std::string> messages;
                BOOST_FOREACH(const boost::property_tree::ptree::value_type& child, entry)
                {
                    if (!child.second.data().empty())
                    {
                        messages.push_back(child.second.data());
                    }
                }
                reason = boost::algorithm::join(messages, "; ");
            }
            return reason;
        }
    }

    SanRestClient::SanRestClient(const SanRestClientSettings& settings)
        : m_settings(settings)
    {
        boost::algorithm::trim_right_if(m_settings.ServiceUri, boost::algorithm::is_any_of("/"));
    }

    std::string SanRestClient::MakeUrl(const std::string& pathOrUrl) const
    {
        if (boost::algorithm::istarts_with(pathOrUrl, "http://") ||
            boost::algorithm::istarts_with(pathOrUrl, "https://"))
        {
            return pathOrUrl;
        }
        return m_settings.ServiceUri + pathOrUrl;
    }

    SISTATUS SanRestClient::MapHttpStatus(long responseCode, const std::string& body)
    {
        if (responseCode >= 200 && responseCode <= 299)
        {
            return SIS_OK;
        }

        if (423 == responseCode)
        {
            return SIE_RESOURCE_LOCKED;
        }

        if (409 == responseCode && boost::algorithm::icontains(body, "locked"))
        {
            return SIE_RESOURCE_LOCKED;
        }

        if (ContainsAnyMarker(body, LockContentionMarkers))
        {
            return SIE_RESOURCE_LOCKED;
        }

        return SIE_HTTP_RESPONSE_FAILED;
    }

    SISTATUS SanRestClient::Get(const std::string& pathOrUrl, std::string& response)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const std::string url = MakeUrl(pathOrUrl);
        long responseCode = 0;
        response.clear();

        try
        {
            CurlOptions options(url);
            options.transferTimeout(m_settings.TransferTimeout)
                .validResponseRange(100, 599)
                .caFile(m_settings.CaFile)
                .header("Accept", SanRestJson::ContentType);
            if (!m_settings.AuthToken.empty())
            {
                options.header("Authorization", "Token " + m_settings.AuthToken);
            }

            boost::mutex::scoped_lock guard(m_curlLock);
            m_curl.get(options, response);
            responseCode = m_curl.responseCode();
        }
        catch (const ErrorException& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: GET %s failed with exception %s\n", FUNCTION_NAME, url.c_str(), e.what());
            return SIE_HTTP_RESPONSE_FAILED;
        }

        SISTATUS status = MapHttpStatus(responseCode, response);
        if (SIS_OK != status)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: GET %s returned %ld (%s): %s\n", FUNCTION_NAME, url.c_str(),
                responseCode, SiStatusToString(status), Abbreviate(response).c_str());
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::Post(const std::string& path, const std::string& body, std::string& response)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        const std::string url = MakeUrl(path);
        long responseCode = 0;
        response.clear();

        try
        {
            CurlOptions options(url);
            options.transferTimeout(m_settings.TransferTimeout)
                .validResponseRange(100, 599)
                .caFile(m_settings.CaFile)
                .header("Content-Type", SanRestJson::ContentType)
                .header("Accept", SanRestJson::ContentType);
            if (!m_settings.AuthToken.empty())
            {
                options.header("Authorization", "Token " + m_settings.AuthToken);
            }

            boost::mutex::scoped_lock guard(m_curlLock);
            m_curl.post(options, body, response);
            responseCode = m_curl.responseCode();
        }
        catch (const ErrorException& e)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: POST %s failed with exception %s\n", FUNCTION_NAME, url.c_str(), e.what());
            return SIE_HTTP_RESPONSE_FAILED;
        }

        SISTATUS status = MapHttpStatus(responseCode, response);
        if (SIS_OK != status)
        {
            DebugPrintf(SI_LOG_ERROR, "%s: POST %s returned %ld (%s): %s\n", FUNCTION_NAME, url.c_str(),
                responseCode, SiStatusToString(status), Abbreviate(response).c_str());
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::GetAllPages(const std::string& path,
        boost::function<void (const boost::property_tree::ptree&)> onItem)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::string next = path;
        size_t pages = 0;
        SISTATUS status = SIS_OK;

        while (!next.empty())
        {
            if (++pages > MAX_LIST_PAGES)
            {
                DebugPrintf(SI_LOG_ERROR, "%s: %s returned more than %lu pages\n", FUNCTION_NAME,
                    path.c_str(), MAX_LIST_PAGES);
                status = SIE_FAIL;
                break;
            }

            std::string response, errMsg;
            status = Get(next, response);
            if (SIS_OK != status)
            {
                break;
            }

            boost::property_tree::ptree pt;
            if (!ReadJson(response, pt, errMsg))
            {
                DebugPrintf(SI_LOG_ERROR, "%s: invalid JSON from %s: %s\n", FUNCTION_NAME, next.c_str(), errMsg.c_str());
                status = SIE_INVALID_FORMAT;
                break;
            }

            boost::optional<boost::property_tree::ptree&> results = pt.get_child_optional(SanRestJson::Results);
            const boost::property_tree::ptree& items = results ? *results : pt;
            BOOST_FOREACH(const boost::property_tree::ptree::value_type& item, items)
            {
                onItem(item.second);
            }

            next = results ? pt.get(SanRestJson::Next, std::string()) : std::string();
            if (next == "null")
            {
                next.clear();
            }
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::ListAliases(SanObjectId fabricId, PersistedAliases_t& aliases)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::string path = SanRestEndpoints::AliasesByFabric + boost::lexical_cast<std::string>(fabricId) +
            "/?page_size=" + boost::lexical_cast<std::string>(m_settings.ListPageSize);

        PersistedAliases_t listed;
        SISTATUS status = GetAllPages(path, boost::bind(AppendAlias, fabricId, boost::ref(listed), _1));
        if (SIS_OK == status)
        {
            aliases.swap(listed);
            DebugPrintf(SI_LOG_INFO, "%s: fabric %lld has %lu aliases\n", FUNCTION_NAME,
                static_cast<long long>(fabricId), aliases.size());
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::ListZones(SanObjectId fabricId, PersistedZones_t& zones)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        std::string path = SanRestEndpoints::ZonesByFabric + boost::lexical_cast<std::string>(fabricId) +
            "/?page_size=" + boost::lexical_cast<std::string>(m_settings.ListPageSize);

        PersistedZones_t listed;
        SISTATUS status = GetAllPages(path, boost::bind(AppendZone, fabricId, boost::ref(listed), _1));
        if (SIS_OK == status)
        {
            zones.swap(listed);
            DebugPrintf(SI_LOG_INFO, "%s: fabric %lld has %lu zones\n", FUNCTION_NAME,
                static_cast<long long>(fabricId), zones.size());
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::ParseSubmissionResponse(const std::string& response,
        const std::string& objectsKey,
        SubmissionResult& result)
    {
        if (boost::algorithm::trim_copy(response).empty())
        {
            return SIS_OK;
        }

        boost::property_tree::ptree pt;
        std::string errMsg;
        if (!ReadJson(response, pt, errMsg))
        {
            DebugPrintf(SI_LOG_WARNING, "%s: save response is not JSON (%s), created ids unknown\n",
                FUNCTION_NAME, errMsg.c_str());
            return SIS_OK;
        }

        boost::optional<boost::property_tree::ptree&> created = pt.get_child_optional(SanRestJson::Created);
        if (created)
        {
            BOOST_FOREACH(const boost::property_tree::ptree::value_type& id, *created)
            {
                boost::optional<SanObjectId> value = id.second.get_value_optional<SanObjectId>();
                if (value)
                {
                    result.CreatedIds.push_back(*value);
                }
            }
        }

        boost::optional<boost::property_tree::ptree&> objects = pt.get_child_optional(objectsKey);
        if (objects)
        {
            BOOST_FOREACH(const boost::property_tree::ptree::value_type& object, *objects)
            {
                boost::optional<SanObjectId> value = object.second.get_optional<SanObjectId>(SanRestJson::Id);
                if (value)
                {
                    result.CreatedIds.push_back(*value);
                }
            }
        }

        bool locked = false;
        bool failed = false;
        boost::optional<boost::property_tree::ptree&> errors = pt.get_child_optional(SanRestJson::Errors);
        if (errors)
        {
            BOOST_FOREACH(const boost::property_tree::ptree::value_type& entry, *errors)
            {
                std::string name = entry.second.get(SanRestJson::Name, entry.first);
                std::string reason = ErrorReason(entry.second);
                bool duplicate = ContainsAnyMarker(reason, DuplicateMarkers);
                if (!duplicate)
                {
                    failed = true;
                    locked = locked || ContainsAnyMarker(reason, LockContentionMarkers);
                }
                result.Errors.push_back(SubmissionItemError(name, reason, duplicate));
            }
        }

        if (locked)
        {
            return SIE_RESOURCE_LOCKED;
        }
        return failed ? SIE_PARTIAL_FAILURE : SIS_OK;
    }

    SISTATUS SanRestClient::Submit(const std::string& path,
        const std::string& objectsKey,
        const boost::property_tree::ptree& items,
        SubmissionResult& result)
    {
        boost::property_tree::ptree request;
        request.put(SanRestJson::ProjectId, m_settings.ProjectId);
        request.add_child(objectsKey, items);

        std::string response;
        SISTATUS status = Post(path, WriteTypedJson(request), response);
        if (SIS_OK == status)
        {
            status = ParseSubmissionResponse(response, objectsKey, result);
        }
        else if (SIE_HTTP_RESPONSE_FAILED == status)
        {
            // a rejected batch may still list the offending items
            SubmissionResult rejected;
            if (SIS_OK != ParseSubmissionResponse(response, objectsKey, rejected) && !rejected.Errors.empty())
            {
                result.Errors.insert(result.Errors.end(), rejected.Errors.begin(), rejected.Errors.end());
                status = SIE_PARTIAL_FAILURE;
            }
        }

        DebugPrintf(SI_LOG_INFO, "%s: %s submitted, %lu created, %lu item errors, %s\n", FUNCTION_NAME,
            objectsKey.c_str(), result.CreatedIds.size(), result.Errors.size(), SiStatusToString(status));
        return status;
    }

    SISTATUS SanRestClient::SubmitAliases(const AliasDtos_t& aliases, SubmissionResult& result)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        boost::property_tree::ptree items;
        AliasDtos_t::const_iterator it = aliases.begin();
        for (/* empty */; it != aliases.end(); ++it)
        {
            boost::property_tree::ptree item;
            it->serialize(item);
            items.push_back(std::make_pair(std::string(), item));
        }

        SISTATUS status = Submit(SanRestEndpoints::SaveAliases, SanRestJson::Aliases, items, result);

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }

    SISTATUS SanRestClient::SubmitZones(const ZoneDtos_t& zones, SubmissionResult& result)
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        boost::property_tree::ptree items;
        ZoneDtos_t::const_iterator it = zones.begin();
        for (/* empty */; it != zones.end(); ++it)
        {
            boost::property_tree::ptree item;
            it->serialize(item);
            items.push_back(std::make_pair(std::string(), item));
        }

        SISTATUS status = Submit(SanRestEndpoints::SaveZones, SanRestJson::Zones, items, result);

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
        return status;
    }
}
