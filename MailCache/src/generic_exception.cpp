//
//  generic_exception.cpp
//  MailCache
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailCache package.
//

#include "mailcache/generic_exception.hpp"

GenericException::GenericException() :
    _message("generic")
{
}

GenericException::GenericException(std::string message) :
    _message(message)
{
}

const char * GenericException::what() const noexcept {
    return _message.c_str();
}

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}
