#pragma once

#include <tgbot/types/InlineKeyboardButton.h>
#include <tgbot/types/InlineKeyboardMarkup.h>

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

// Lays out inline buttons, x buttons per row.
class KeyboardBuilder {
    TgBot::InlineKeyboardMarkup::Ptr keyboard;
    int x;

   public:
    // text, callback data
    using Button = std::pair<std::string, std::string>;
    using ListOfButton = std::initializer_list<Button>;

    explicit KeyboardBuilder(int x) : x(x) {
        if (x <= 0) {
            throw std::logic_error("x must be positive");
        }
        keyboard = std::make_shared<TgBot::InlineKeyboardMarkup>();
    }

    // Always starts a new row, a partially filled last row stays as is.
    KeyboardBuilder& addKeyboard(ListOfButton list) {
        if (list.size() == 0) {
            return *this;
        }

        decltype(keyboard->inlineKeyboard) addingList(
            list.size() / x + (list.size() % x == 0 ? 0 : 1));
        for (size_t i = 0; i < addingList.size(); ++i) {
            addingList[i].resize(std::min<size_t>(x, list.size() - i * x));
        }

        int idx = 0;
        for (const auto& [text, callbackData] : list) {
            auto button = std::make_shared<TgBot::InlineKeyboardButton>();
            button->text = text;
            button->callbackData = callbackData;
            addingList[idx / x][idx % x] = button;
            ++idx;
        }

        keyboard->inlineKeyboard.insert(keyboard->inlineKeyboard.end(),
                                        addingList.begin(), addingList.end());
        return *this;
    }
    TgBot::InlineKeyboardMarkup::Ptr get() { return keyboard; }
};
