/*
+------------------------------------------------------------------------------------+
File        : FakeRoleClassifier.h

Description : RoleClassifier answering from a WWPN table and counting lookups.

+------------------------------------------------------------------------------------+
*/
#ifndef _FAKE_ROLE_CLASSIFIER_H
#define _FAKE_ROLE_CLASSIFIER_H

#include <map>
#include <string>

#include <boost/thread/mutex.hpp>

#include "RoleClassifier.h"

namespace SanImportTest
{
    using namespace SanImportLib;

    class FakeRoleClassifier : public RoleClassifier
    {
    public:
        FakeRoleClassifier() : Lookups(0) {}

        virtual SISTATUS Classify(const std::string& wwpn, AliasRole& role)
        {
            boost::mutex::scoped_lock guard(m_lock);
            Lookups++;

            std::map<std::string, SISTATUS>::const_iterator failure = Failures.find(wwpn);
            if (failure != Failures.end())
                return failure->second;

            std::map<std::string, AliasRole>::const_iterator rule = Roles.find(wwpn);
            if (rule == Roles.end())
                return SIS_FALSE;

            role = rule->second;
            return SIS_OK;
        }

        std::map<std::string, AliasRole> Roles;
        std::map<std::string, SISTATUS> Failures;
        unsigned int Lookups;

    private:
        boost::mutex m_lock;
    };

    typedef boost::shared_ptr<FakeRoleClassifier> FakeRoleClassifierPtr;
}

#endif
