/*
 * 설명: REST 응답 엔벨로프와 도메인 객체의 JSON 표현을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "wager/domain.hpp"

namespace wager {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// 금액은 센트 단위 정수. 시각은 epoch 밀리초.
nlohmann::json ToJson(const User& user);
nlohmann::json ToJson(const Event& event, TimePoint now);
nlohmann::json ToJson(const Wager& wager);
nlohmann::json ToJson(const WagerPage& page, std::size_t page_number, std::size_t page_size);

}  // namespace wager
