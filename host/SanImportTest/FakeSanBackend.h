/*
+------------------------------------------------------------------------------------+
File        : FakeSanBackend.h

Description : In-memory SanPersistenceClient with scripted lock contention,
              read-after-write lag and per-item errors.

+------------------------------------------------------------------------------------+
*/
#ifndef _FAKE_SAN_BACKEND_H
#define _FAKE_SAN_BACKEND_H

#include <map>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>

#include "SanPersistenceClient.h"
#include "SanImportConstants.h"
#include "SanImportUtils.h"

namespace SanImportTest
{
    using namespace SanImportLib;

    class FakeSanBackend : public SanPersistenceClient
    {
    public:
        FakeSanBackend()
            : NextId(100),
            ListAliasesStatus(SIS_OK),
            ListZonesStatus(SIS_OK),
            LockedAliasSubmissions(0),
            LockedZoneSubmissions(0),
            CreateBeforeLock(false),
            AliasSubmitStatus(SIS_OK),
            RefreshLag(0),
            ListAliasesCalls(0),
            ListZonesCalls(0),
            m_visibleBeforeSubmit(0),
            m_hiddenListings(0)
        {}

        /// \brief seeds an alias that exists before the import
        SanObjectId AddPersistedAlias(const std::string& name, const std::string& wwpn, SanObjectId fabricId = 1)
        {
            SanObjectId id = NextId++;
            m_aliases.push_back(PersistedAlias(id, name, wwpn, fabricId));
            return id;
        }

        SanObjectId AddPersistedZone(const std::string& name, SanObjectId fabricId = 1)
        {
            SanObjectId id = NextId++;
            m_zones.push_back(PersistedZone(id, name, fabricId));
            return id;
        }

        virtual SISTATUS ListAliases(SanObjectId fabricId, PersistedAliases_t& aliases)
        {
            ListAliasesCalls++;
            if (SIS_OK != ListAliasesStatus)
                return ListAliasesStatus;

            size_t visible = m_aliases.size();
            if (m_hiddenListings)
            {
                m_hiddenListings--;
                visible = m_visibleBeforeSubmit;
            }

            aliases.clear();
            for (size_t i = 0; i < visible; i++)
            {
                if (m_aliases[i].FabricId == fabricId)
                    aliases.push_back(m_aliases[i]);
            }
            return SIS_OK;
        }

        virtual SISTATUS ListZones(SanObjectId fabricId, PersistedZones_t& zones)
        {
            ListZonesCalls++;
            if (SIS_OK != ListZonesStatus)
                return ListZonesStatus;

            zones.clear();
            PersistedZones_t::const_iterator it = m_zones.begin();
            for (/* empty */; it != m_zones.end(); ++it)
            {
                if (it->FabricId == fabricId)
                    zones.push_back(*it);
            }
            return SIS_OK;
        }

        virtual SISTATUS SubmitAliases(const AliasDtos_t& aliases, SubmissionResult& result)
        {
            SubmittedAliases.push_back(aliases);
            if (OnSubmit)
                OnSubmit();

            if (SIS_OK != AliasSubmitStatus)
                return AliasSubmitStatus;

            if (LockedAliasSubmissions)
            {
                LockedAliasSubmissions--;
                if (CreateBeforeLock)
                {
                    AliasDtos_t::const_iterator it = aliases.begin();
                    for (/* empty */; it != aliases.end(); ++it)
                        m_aliases.push_back(PersistedAlias(NextId++, it->Name, it->Wwpn, it->FabricId));
                }
                return SIE_RESOURCE_LOCKED;
            }

            m_visibleBeforeSubmit = m_aliases.size();
            SISTATUS status = SIS_OK;
            AliasDtos_t::const_iterator it = aliases.begin();
            for (/* empty */; it != aliases.end(); ++it)
            {
                if (Rejected(it->Name, AliasErrors, result, status))
                    continue;

                SanObjectId id = NextId++;
                m_aliases.push_back(PersistedAlias(id, it->Name, it->Wwpn, it->FabricId));
                result.CreatedIds.push_back(id);
            }
            m_hiddenListings = RefreshLag;
            return status;
        }

        virtual SISTATUS SubmitZones(const ZoneDtos_t& zones, SubmissionResult& result)
        {
            SubmittedZones.push_back(zones);

            if (LockedZoneSubmissions)
            {
                LockedZoneSubmissions--;
                return SIE_RESOURCE_LOCKED;
            }

            SISTATUS status = SIS_OK;
            ZoneDtos_t::const_iterator it = zones.begin();
            for (/* empty */; it != zones.end(); ++it)
            {
                if (Rejected(it->Name, ZoneErrors, result, status))
                    continue;

                SanObjectId id = NextId++;
                m_zones.push_back(PersistedZone(id, it->Name, it->FabricId));
                result.CreatedIds.push_back(id);
            }
            return status;
        }

        SanObjectId AliasId(const std::string& name) const
        {
            PersistedAliases_t::const_iterator it = m_aliases.begin();
            for (/* empty */; it != m_aliases.end(); ++it)
            {
                if (it->Name == name)
                    return it->Id;
            }
            return 0;
        }

        size_t AliasCount() const { return m_aliases.size(); }
        size_t ZoneCount() const { return m_zones.size(); }

        SanObjectId NextId;
        SISTATUS ListAliasesStatus;
        SISTATUS ListZonesStatus;

        /// \brief alias submissions answered with SIE_RESOURCE_LOCKED before one succeeds
        unsigned int LockedAliasSubmissions;
        unsigned int LockedZoneSubmissions;

        /// \brief a locked alias submission still stores its rows
        bool CreateBeforeLock;

        /// \brief whole-call status of every alias submission when not SIS_OK
        SISTATUS AliasSubmitStatus;

        /// \brief alias listings after a submission that do not show the new rows yet
        unsigned int RefreshLag;

        /// \brief name to per-item error reason
        std::map<std::string, std::string> AliasErrors;
        std::map<std::string, std::string> ZoneErrors;

        boost::function<void ()> OnSubmit;

        std::vector<AliasDtos_t> SubmittedAliases;
        std::vector<ZoneDtos_t> SubmittedZones;
        unsigned int ListAliasesCalls;
        unsigned int ListZonesCalls;

    private:
        static bool Rejected(const std::string& name,
            const std::map<std::string, std::string>& errors,
            SubmissionResult& result,
            SISTATUS& status)
        {
            std::map<std::string, std::string>::const_iterator error = errors.find(name);
            if (error == errors.end())
                return false;

            bool duplicate = ContainsAnyMarker(error->second, DuplicateMarkers);
            result.Errors.push_back(SubmissionItemError(name, error->second, duplicate));
            if (!duplicate)
                status = SIE_PARTIAL_FAILURE;
            return true;
        }

        PersistedAliases_t m_aliases;
        PersistedZones_t m_zones;
        size_t m_visibleBeforeSubmit;
        unsigned int m_hiddenListings;
    };

    typedef boost::shared_ptr<FakeSanBackend> FakeSanBackendPtr;
}

#endif
