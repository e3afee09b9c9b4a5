//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Intrusive singly-linked list helpers
//!
//!\details
//! The log-handler registry (log.h) chains handlers through a pointer
//! stored in each handler, so registration needs no heap allocation.
//! Any class used with `ListCore` must:
//!  * befriend leasecat::util::ListCore,
//!  * hold a member "m_next" of its own pointer type, initialized to zero,
//!  * appear in a given list at most once.

#pragma once

namespace leasecat {
    namespace util {
        //! Static helpers for intrusive lists, grouped for easy friendship.
        class ListCore {
        public:
            //! Push an item onto the head of the list.
            template <class T> static inline
            void add(T*& head, T* item) {
                item->m_next = head;
                head = item;
            }

            //! Locate the pointer that refers to `item`: either `*head`
            //! or the "m_next" field of its predecessor.
            //! \returns Null if the item is not in the list.
            template <class T> static inline
            T** find_ptr(T** head, const T* item) {
                for (T** link = head ; *link ; link = &((*link)->m_next)) {
                    if (*link == item) return link;
                }
                return 0;
            }

            //! Successor of the given item, or null at the end of the list.
            template <class T> static inline
            T* next(const T* item) {
                return item->m_next;
            }

            //! Unlink an item, if present, and clear its "m_next" field.
            template <class T> static inline
            void remove(T*& head, T* item) {
                T** link = find_ptr<T>(&head, item);
                if (link) *link = item->m_next;
                item->m_next = 0;
            }
        };
    }
}
