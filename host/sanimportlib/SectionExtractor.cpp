/*
+------------------------------------------------------------------------------------+
File        : SectionExtractor.cpp

Description : SectionExtractor implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "SectionExtractor.h"
#include "FormatClassifier.h"
#include "logger.h"

namespace SanImportLib
{
    namespace
    {
        const boost::regex s_deviceAliasCommand("^device-alias\\s+database\\b", boost::regex::icase);

        const boost::regex s_fcaliasCommand("^fcalias\\b", boost::regex::icase);

        const boost::regex s_zoneCommand(
            "^zone(?:set)?\\b(?!\\s+(?:status|statistics|analysis|pending))",
            boost::regex::icase);

        // a single VSAN, not a range such as vsan 1-4093
        const boost::regex s_vsan("\\bvsan\\s+(\\d+)(?![\\d,\\-])", boost::regex::icase);

        const char* SectionKindName(SectionKind kind)
        {
            switch (kind)
            {
            case SECTION_DEVICE_ALIAS:
                return "device-alias";
            case SECTION_FCALIAS:
                return "fcalias";
            case SECTION_ZONE:
                return "zone";
            default:
                return "fallback";
            }
        }

        // !Full Zone Database Section for vsan 10
        const boost::regex s_zoneDatabaseMarker(
            "^\\s*!\\s*(?:Full|Active)\\s+Zone\\s+Database\\s+Section\\s+for\\s+vsan\\s+(\\d+)",
            boost::regex::icase);

        // *** show tech-support fcdomain ***, ### module 1 ###
        const boost::regex s_topLevelMarker("^(?:\\*{3,}|#{3,}|={3,})\\s*\\S.*$");

        const boost::regex s_configSyntax(
            "^\\s*(?:device-alias\\s+\\S+|fcalias\\s+name\\s|zone\\s+name\\s|zoneset\\s+name\\s|"
            "member\\s|pwwn\\s|\\*\\s*fcid\\s|attribute\\s)",
            boost::regex::icase);

        const boost::regex s_definitionSyntax(
            "^\\s*(?:device-alias\\s+name|fcalias\\s+name|zone\\s+name)\\s",
            boost::regex::icase);

        void ParseVsan(const std::string& text, const boost::regex& expression, boost::optional<int>& vsan)
        {
            boost::smatch what;
            if (boost::regex_search(text, what, expression))
            {
                try
                {
                    vsan = boost::lexical_cast<int>(what.str(1));
                }
                catch (const boost::bad_lexical_cast&)
                {
                    DebugPrintf(SI_LOG_WARNING, "%s: ignoring out of range vsan %s\n",
                        FUNCTION_NAME, what.str(1).c_str());
                }
            }
        }

        bool HasDefinitionSyntax(const TextSection& section)
        {
            SourceLines_t::const_iterator it = section.Lines.begin();
            for (/* empty */; it != section.Lines.end(); ++it)
            {
                if (boost::regex_search(it->Text, s_definitionSyntax))
                    return true;
            }
            return false;
        }
    }

    std::vector<const TextSection*> ExtractedSections::AliasSections() const
    {
        std::vector<const TextSection*> selected;
        TextSections_t::const_iterator it = Sections.begin();
        for (/* empty */; it != Sections.end(); ++it)
        {
            selected.push_back(&(*it));
        }
        return selected;
    }

    std::vector<const TextSection*> ExtractedSections::ZoneSections() const
    {
        std::vector<const TextSection*> selected;
        TextSections_t::const_iterator it = Sections.begin();
        for (/* empty */; it != Sections.end(); ++it)
        {
            if (SECTION_DEVICE_ALIAS != it->Kind && SECTION_FCALIAS != it->Kind)
                selected.push_back(&(*it));
        }
        return selected;
    }

    bool SectionExtractor::IsDivider(const std::string& trimmed) const
    {
        if (trimmed.size() < m_dividerMinLength)
            return false;

        const char ch = trimmed[0];
        if ('-' != ch && '=' != ch && '*' != ch)
            return false;

        return std::string::npos == trimmed.find_first_not_of(ch);
    }

    void SectionExtractor::Flush(TextSection& current, ExtractorState state, TextSections_t& sections)
    {
        if (STATE_IDLE != state && !current.Lines.empty())
        {
            DebugPrintf(SI_LOG_INFO, "%s section closed with %lu lines (first line %lu)\n",
                SectionKindName(current.Kind),
                current.Lines.size(), current.Lines.front().Number);
            sections.push_back(current);
        }
        current = TextSection();
    }

    void SectionExtractor::Extract(const SourceLines_t& lines, ExtractedSections& sections) const
    {
        DebugPrintf(SI_LOG_DEBUG, "ENTERED %s\n", FUNCTION_NAME);

        sections = ExtractedSections();

        ExtractorState state = STATE_IDLE;
        TextSection current;
        bool deviceAliasSeen = false;
        size_t blankLines = 0;

        SourceLines_t::const_iterator it = lines.begin();
        for (/* empty */; it != lines.end(); ++it)
        {
            const std::string trimmed = boost::algorithm::trim_copy(it->Text);
            std::string command;

            if (FormatClassifier::IsShowBanner(it->Text, command))
            {
                Flush(current, state, sections.Sections);
                state = STATE_IDLE;

                if (boost::regex_search(command, s_deviceAliasCommand))
                {
                    if (deviceAliasSeen)
                    {
                        DebugPrintf(SI_LOG_DEBUG, "%s: ignoring repeated device-alias banner at line %lu\n",
                            FUNCTION_NAME, it->Number);
                        continue;
                    }
                    deviceAliasSeen = true;
                    state = STATE_IN_DEVICE_ALIAS_SHOW;
                    current = TextSection(SECTION_DEVICE_ALIAS);
                    blankLines = 0;
                }
                else if (boost::regex_search(command, s_fcaliasCommand))
                {
                    state = STATE_IN_FCALIAS_SHOW;
                    current = TextSection(SECTION_FCALIAS);
                    ParseVsan(command, s_vsan, current.Vsan);
                }
                else if (boost::regex_search(command, s_zoneCommand))
                {
                    state = STATE_IN_ZONE_SHOW;
                    current = TextSection(SECTION_ZONE);
                    ParseVsan(command, s_vsan, current.Vsan);
                }
                continue;
            }

            if (boost::regex_search(it->Text, s_zoneDatabaseMarker))
            {
                Flush(current, state, sections.Sections);
                state = STATE_IN_ZONE_SHOW;
                current = TextSection(SECTION_ZONE);
                ParseVsan(it->Text, s_zoneDatabaseMarker, current.Vsan);
                continue;
            }

            if (STATE_IDLE == state)
            {
                continue;
            }

            if (IsDivider(trimmed) || boost::regex_match(trimmed, s_topLevelMarker))
            {
                DebugPrintf(SI_LOG_DEBUG, "%s: section boundary at line %lu\n", FUNCTION_NAME, it->Number);
                Flush(current, state, sections.Sections);
                state = STATE_IDLE;
                continue;
            }

            if (STATE_IN_DEVICE_ALIAS_SHOW == state)
            {
                if (trimmed.empty())
                {
                    if (++blankLines >= DEVICE_ALIAS_SECTION_MAX_BLANK_LINES)
                    {
                        Flush(current, state, sections.Sections);
                        state = STATE_IDLE;
                    }
                    continue;
                }
                blankLines = 0;
            }

            current.Lines.push_back(*it);
        }

        Flush(current, state, sections.Sections);

        bool hasSyntax = false;
        TextSections_t::const_iterator sectionIt = sections.Sections.begin();
        for (/* empty */; sectionIt != sections.Sections.end() && !hasSyntax; ++sectionIt)
        {
            hasSyntax = HasDefinitionSyntax(*sectionIt);
        }

        if (!hasSyntax)
        {
            ExtractFallback(lines, sections);
        }

        DebugPrintf(SI_LOG_DEBUG, "EXITED %s\n", FUNCTION_NAME);
    }

    void SectionExtractor::ExtractFallback(const SourceLines_t& lines, ExtractedSections& sections) const
    {
        TextSection fallback(SECTION_FALLBACK);
        bool inGap = false;

        SourceLines_t::const_iterator it = lines.begin();
        for (/* empty */; it != lines.end(); ++it)
        {
            if (boost::regex_search(it->Text, s_configSyntax))
            {
                fallback.Lines.push_back(*it);
                inGap = false;
            }
            else if (!fallback.Lines.empty() && !inGap)
            {
                // keeps block boundaries so an fcalias or zone does not absorb later members
                fallback.Lines.push_back(SourceLine(it->Number, std::string()));
                inGap = true;
            }
        }

        if (HasDefinitionSyntax(fallback))
        {
            DebugPrintf(SI_LOG_WARNING, "no dump section carried alias or zone definitions, "
                "extracting %lu matching lines directly\n", fallback.Lines.size());
            sections.Sections.clear();
            sections.Sections.push_back(fallback);
            sections.UsedFallback = true;
        }
        else
        {
            DebugPrintf(SI_LOG_INFO, "%s: no alias or zone syntax found\n", FUNCTION_NAME);
        }
    }
}
