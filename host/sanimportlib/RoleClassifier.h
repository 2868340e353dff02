/*
+------------------------------------------------------------------------------------+
File        : RoleClassifier.h

Description : Interface of the per-WWPN role classification service.

+------------------------------------------------------------------------------------+
*/
#ifndef _ROLE_CLASSIFIER_H
#define _ROLE_CLASSIFIER_H

#include <string>

#include <boost/shared_ptr.hpp>

#include "sistatus.h"
#include "SanImportContracts.h"

namespace SanImportLib
{
    /// \brief answers whether a WWPN belongs to an initiator, a target or both
    ///
    /// implementations must be safe to call from several threads at once
    class RoleClassifier
    {
    public:
        virtual ~RoleClassifier() {}

        /// \param wwpn normalized WWPN
        /// \param role receives the role when SIS_OK is returned
        /// \returns SIS_OK when a rule matched, SIS_FALSE when no rule matched,
        /// a SIE_* code when the lookup itself failed
        virtual SISTATUS Classify(const std::string& wwpn, AliasRole& role) = 0;
    };

    typedef boost::shared_ptr<RoleClassifier> RoleClassifierPtr;
}

#endif
