#ifndef SAN_IMPORT_CLI_EXCP_H
#define SAN_IMPORT_CLI_EXCP_H

#include <iostream>
#include <string>

class SanImportCliException : public std::exception
{
    std::string m_what;
    int m_status;
public:
    explicit SanImportCliException(
        const std::string & message,
        int exitcode)
        : m_what(message),
        m_status(exitcode)
    {}

    const char * what() const throw()
    {
        return m_what.c_str();
    }

    int status() const
    {
        return m_status;
    }

    ~SanImportCliException() throw()
    {}
};

#endif // SAN_IMPORT_CLI_EXCP_H
