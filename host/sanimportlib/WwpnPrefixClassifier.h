/*
+------------------------------------------------------------------------------------+
File        : WwpnPrefixClassifier.h

Description : RoleClassifier that looks up the first four hex digits of a WWPN in a
              vendor prefix table.

+------------------------------------------------------------------------------------+
*/
#ifndef _WWPN_PREFIX_CLASSIFIER_H
#define _WWPN_PREFIX_CLASSIFIER_H

#include <map>
#include <string>

#include <boost/property_tree/ptree.hpp>

#include "RoleClassifier.h"
#include "SanRestClient.h"

namespace SanImportLib
{
    class WwpnPrefixRule
    {
    public:
        WwpnPrefixRule() : Role(ROLE_INITIATOR) {}
        WwpnPrefixRule(AliasRole role, const std::string& vendor) : Role(role), Vendor(vendor) {}

        AliasRole Role;
        std::string Vendor;
    };

    /// \brief prefix table keyed by four lowercase hex digits
    ///
    /// the table is only written while loading, Classify may then be called
    /// from several threads
    class WwpnPrefixClassifier : public RoleClassifier
    {
    public:
        /// \brief adds or replaces a rule
        /// \returns false when the prefix is not four hex digits or the type is not init, target or both
        bool AddRule(const std::string& prefix, const std::string& wwpnType, const std::string& vendor = std::string());

        /// \brief [{"prefix": "c050", "wwpn_type": "init", "vendor": ".."}], bare or under "results"
        SISTATUS LoadFromJson(const std::string& json);

        /// \brief JSON file, or an ini file whose [prefixes] section maps prefix=type[,vendor]
        SISTATUS LoadFromFile(const std::string& path);

        /// \brief reads the table from the wwpn-prefixes endpoint of the service
        SISTATUS LoadFromService(SanRestClient& client);

        virtual SISTATUS Classify(const std::string& wwpn, AliasRole& role);

        size_t RuleCount() const { return m_rules.size(); }

    private:
        void AddJsonRule(const boost::property_tree::ptree& item);

        std::map<std::string, WwpnPrefixRule> m_rules;
    };

    typedef boost::shared_ptr<WwpnPrefixClassifier> WwpnPrefixClassifierPtr;
}

#endif
