///
///  \file errorexception.h
///
///  \brief exception used by the plumbing layers (curl wrapper, settings, url parsing)
///
/// \note
/// \li \c engine entry points catch it and convert to SISTATUS, it never crosses the library boundary
/// \li \c stream manipulators such as std::hex and std::setw work, std::endl does not
///

#ifndef ERROREXCEPTION_H
#define ERROREXCEPTION_H

#include <stdexcept>
#include <string>
#include <sstream>

#include <boost/lexical_cast.hpp>

/// \brief file:function:line of the macro expansion
#define FILE_FUNC_LINE (std::string(__FILE__) + ":" + std::string(__FUNCTION__) + ":" + boost::lexical_cast<std::string>(__LINE__))

/// \brief use when you want to add file, function, and line number when logging
#define AT_LOC std::string("[at " + FILE_FUNC_LINE + "]   ").c_str()

/// \brief use if you want to add file, function, and line number when throwing an exception
#define THROW_LOC std::string("[thrown at " + FILE_FUNC_LINE + "]    ")

/// \brief use if you want to add the exception catch location when logging caught exceptions
#define CATCH_LOC std::string("[caught at " + FILE_FUNC_LINE + "]    ").c_str()

/// \brief for throwing exceptions
class ErrorException : public std::exception {
public:
    /// \brief constructor
    ///
    /// \param data to include with the exception
    explicit ErrorException(std::string const& data = std::string())
        : m_what(data)
        { }

    ErrorException(ErrorException const& ec)
        : std::exception(ec),
          m_what(ec.m_what)
        { }

    ~ErrorException() throw()
        { }

    /// \brief used to add data using iostream style syntax
    template<typename DATA_TYPE>
    ErrorException& operator<<(DATA_TYPE const& data) ///< additional data to add
        {
            std::ostringstream stream;
            stream << data;
            m_what += stream.str();
            return *this;
        }

    /// \brief get the exception text
    const char* what() const throw() {
        return m_what.c_str();
    }

private:
    std::string m_what;
};

/// \brief helps in creating and throwing an ErrorException
///
/// \note
/// \li need to use throw keyword as it is not part of the macro
/// \li places the throw location before the exception message
///
/// e.g.
/// \code
/// throw ERROR_EXCEPTION << "invalid url: " << url;
/// \endcode
#define ERROR_EXCEPTION ErrorException(THROW_LOC)

#endif // ERROREXCEPTION_H
