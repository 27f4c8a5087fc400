#pragma once

#include <koinos/exception.hpp>

namespace magpie::mq {

KOINOS_DECLARE_EXCEPTION( mq_exception );

// Exchange
KOINOS_DECLARE_DERIVED_EXCEPTION( exchange_definition_error, mq_exception );
KOINOS_DECLARE_DERIVED_EXCEPTION( channel_released, mq_exception );

// Publishing
KOINOS_DECLARE_DERIVED_EXCEPTION( publish_error, mq_exception );
KOINOS_DECLARE_DERIVED_EXCEPTION( publish_timeout_error, publish_error );
KOINOS_DECLARE_DERIVED_EXCEPTION( publish_rejected_error, publish_error );

// Connection
KOINOS_DECLARE_DERIVED_EXCEPTION( connection_failure, mq_exception );
KOINOS_DECLARE_DERIVED_EXCEPTION( connection_not_connected, mq_exception );

} // namespace magpie::mq
