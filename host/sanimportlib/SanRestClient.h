/*
+------------------------------------------------------------------------------------+
File        : SanRestClient.h

Description : SanPersistenceClient over the SAN inventory REST service, using the
              curl wrapper and property_tree JSON.

+------------------------------------------------------------------------------------+
*/
#ifndef _SAN_REST_CLIENT_H
#define _SAN_REST_CLIENT_H

#include <string>

#include <boost/cstdint.hpp>
#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/property_tree/ptree.hpp>

#include "curlwrapper.h"
#include "SanPersistenceClient.h"

namespace SanImportLib
{
    /// \brief [backend] section of the import settings
    class SanRestClientSettings
    {
    public:
        SanRestClientSettings()
            : ServiceUri("http://localhost:8000"),
            ProjectId(0),
            TransferTimeout(60),
            ListPageSize(10000)
        {}

        /// \brief scheme, host and optional port, no trailing path
        std::string ServiceUri;

        /// \brief project the submitted aliases and zones are attached to
        SanObjectId ProjectId;

        /// \brief seconds
        int TransferTimeout;

        /// \brief CA bundle for https, system bundle when empty
        std::string CaFile;

        /// \brief sent as "Authorization: Token <AuthToken>" when not empty
        std::string AuthToken;

        uint32_t ListPageSize;
    };

    class SanRestClient : public SanPersistenceClient
    {
    public:
        explicit SanRestClient(const SanRestClientSettings& settings);

        virtual SISTATUS ListAliases(SanObjectId fabricId, PersistedAliases_t& aliases);
        virtual SISTATUS ListZones(SanObjectId fabricId, PersistedZones_t& zones);
        virtual SISTATUS SubmitAliases(const AliasDtos_t& aliases, SubmissionResult& result);
        virtual SISTATUS SubmitZones(const ZoneDtos_t& zones, SubmissionResult& result);

        /// \brief GET of a path relative to the service uri, or of an absolute url
        /// \returns SIS_OK on a 2xx response, SIE_RESOURCE_LOCKED on lock contention,
        /// SIE_HTTP_RESPONSE_FAILED otherwise
        SISTATUS Get(const std::string& pathOrUrl, std::string& response);

        /// \brief POST of a JSON body, same return codes as Get
        SISTATUS Post(const std::string& path, const std::string& body, std::string& response);

        /// \brief GET of a list endpoint, following "next" links
        ///
        /// accepts a bare JSON array or an object whose "results" member holds the page
        SISTATUS GetAllPages(const std::string& path,
            boost::function<void (const boost::property_tree::ptree&)> onItem);

        /// \brief maps an HTTP status and body to a SISTATUS
        static SISTATUS MapHttpStatus(long responseCode, const std::string& body);

        /// \brief reads created ids and per-item errors of a save response
        /// \param objectsKey "aliases" or "zones", objects carrying an "id" count as created
        static SISTATUS ParseSubmissionResponse(const std::string& response,
            const std::string& objectsKey,
            SubmissionResult& result);

    private:
        std::string MakeUrl(const std::string& pathOrUrl) const;

        SISTATUS Submit(const std::string& path,
            const std::string& objectsKey,
            const boost::property_tree::ptree& items,
            SubmissionResult& result);

        SanRestClientSettings m_settings;

        /// \brief a curl easy handle is not shared between threads
        boost::mutex m_curlLock;
        CurlWrapper m_curl;
    };

    typedef boost::shared_ptr<SanRestClient> SanRestClientPtr;
}

#endif
