/*
+------------------------------------------------------------------------------------+
File        : ZoneExtractor.h

Description : Converts zone and zoneset blocks into ZoneCandidates, resolving every
              member token against persisted aliases and aliases of the current batch.

+------------------------------------------------------------------------------------+
*/
#ifndef _ZONE_EXTRACTOR_H
#define _ZONE_EXTRACTOR_H

#include <map>
#include <string>

#include <boost/optional.hpp>

#include "SanImportContracts.h"

namespace SanImportLib
{
    /// \brief name and WWPN index over persisted and batch aliases
    ///
    /// persisted aliases are searched before batch aliases, the first alias
    /// registered under a key wins. Names compare case-insensitively
    class AliasLookup
    {
    public:
        AliasLookup(const PersistedAliases_t& persisted, const AliasCandidates_t& batch);

        /// \brief by case-insensitive name then by normalized WWPN, persisted first then batch
        /// \returns Persisted(id) or InBatch(name), none when nothing matched
        boost::optional<MemberRef> Resolve(const boost::optional<std::string>& name,
            const boost::optional<std::string>& wwpn) const;

    private:
        std::map<std::string, SanObjectId> m_persistedByName;
        std::map<std::string, SanObjectId> m_persistedByWwpn;
        std::map<std::string, std::string> m_batchByName;
        std::map<std::string, std::string> m_batchByWwpn;
    };

    class ZoneExtractor
    {
    public:
        ZoneExtractor(const ZoneDefaults& defaults, SanObjectId fabricId)
            : m_defaults(defaults),
            m_fabricId(fabricId)
        {}

        /// \brief appends the zones declared in the fragment
        ///
        /// member shapes inside an open zone
        /// \li member fcalias|device-alias <name>
        /// \li [member] pwwn <wwpn> [\[name\]] [init|target|both]
        /// \li * fcid <hex> [device-alias <name>] [pwwn <wwpn>] [<name>]
        /// \li [member] device-alias <name> [\[pwwn <wwpn>\]]
        ///
        /// tokens that match no alias are kept in ZoneCandidate::Unresolved
        void Extract(const SourceLines_t& fragment,
            const std::string& sourceName,
            const boost::optional<int>& ambientVsan,
            const AliasLookup& lookup,
            ZoneCandidates_t& zones) const;

    private:
        struct OpenZone {
            OpenZone() : Indent(0), RoleTagged(false), PeerAttribute(false) {}
            ZoneCandidate Zone;
            size_t Indent;
            bool RoleTagged;
            bool PeerAttribute;

            /// \brief indentation of an fcalias expanded inline by show zone output
            boost::optional<size_t> InlineFcaliasIndent;
        };

        void AddMember(OpenZone& open,
            const boost::optional<std::string>& name,
            const boost::optional<std::string>& wwpn,
            const std::string& kind,
            const std::string& rawToken,
            size_t originLine,
            const AliasLookup& lookup) const;

        void CloseZone(boost::optional<OpenZone>& open, ZoneCandidates_t& zones) const;

        ZoneDefaults m_defaults;
        SanObjectId m_fabricId;
    };
}

#endif
