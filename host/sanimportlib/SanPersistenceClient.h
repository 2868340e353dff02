/*
+------------------------------------------------------------------------------------+
File        : SanPersistenceClient.h

Description : Interface of the service that stores aliases and zones.

+------------------------------------------------------------------------------------+
*/
#ifndef _SAN_PERSISTENCE_CLIENT_H
#define _SAN_PERSISTENCE_CLIENT_H

#include <boost/shared_ptr.hpp>

#include "sistatus.h"
#include "SanImportContracts.h"

namespace SanImportLib
{
    /// \brief persistence collaborator of the import orchestrator
    ///
    /// every call returns SIE_RESOURCE_LOCKED on transient lock contention,
    /// the caller decides whether to retry
    class SanPersistenceClient
    {
    public:
        virtual ~SanPersistenceClient() {}

        /// \brief every persisted alias of the fabric, all pages read
        virtual SISTATUS ListAliases(SanObjectId fabricId, PersistedAliases_t& aliases) = 0;

        /// \brief every persisted zone of the fabric
        virtual SISTATUS ListZones(SanObjectId fabricId, PersistedZones_t& zones)
        {
            return SIE_NOTIMPL;
        }

        /// \returns SIS_OK when every item was accepted, SIE_PARTIAL_FAILURE when
        /// result.Errors lists rejected items, other SIE_* codes when the call failed as a whole
        virtual SISTATUS SubmitAliases(const AliasDtos_t& aliases, SubmissionResult& result) = 0;

        /// \brief as SubmitAliases, zone members are persisted alias ids
        virtual SISTATUS SubmitZones(const ZoneDtos_t& zones, SubmissionResult& result) = 0;
    };

    typedef boost::shared_ptr<SanPersistenceClient> SanPersistenceClientPtr;
}

#endif
