////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#include <multidict/containers/folding.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <iterator>
#include <locale>
//------------------------------------------------------------------------------
namespace multidict
{
//------------------------------------------------------------------------------

// The classic locale only knows the ASCII letters: anything else (incl. UTF-8
// lead/continuation bytes) is passed through unchanged.

std::string ascii_case_fold::fold( std::string_view const key ) const
{
    std::string folded;
    folded.reserve( key.size() );
    boost::algorithm::to_lower_copy( std::back_inserter( folded ), key, std::locale::classic() );
    return folded;
}

bool ascii_case_fold::eq( std::string_view const left, std::string_view const right ) const noexcept
{
    return boost::algorithm::iequals( left, right, std::locale::classic() );
}

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
